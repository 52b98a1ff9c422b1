#pragma once
/*
 * Layout
 *
 * Purpose: split a rectangle into ordered segments along one axis.
 * Rule: remainder cells from proportional constraints go one each to the
 *       earliest proportional constraints with a fractional share; leftover
 *       slack goes to the first Min, else to the last Percent/Ratio.
 */
#include <cstdint>
#include <vector>
#include "types.hpp"

struct Constraint {
  enum class Kind { Fixed, Percent, Ratio, Min, Max };
  Kind kind = Kind::Fixed;
  uint32_t a = 0; // length, percent or numerator
  uint32_t b = 0; // denominator (Ratio only)

  static Constraint fixed(uint32_t len) { return {Kind::Fixed, len, 0}; }
  static Constraint percent(uint32_t p) { return {Kind::Percent, p, 0}; }
  static Constraint ratio(uint32_t n, uint32_t d) { return {Kind::Ratio, n, d}; }
  static Constraint min(uint32_t len) { return {Kind::Min, len, 0}; }
  static Constraint max(uint32_t len) { return {Kind::Max, len, 0}; }
};

struct Margins {
  int left = 0;
  int top = 0;
  int right = 0;
  int bottom = 0;
};

// Shrinks each axis only when its two margins fit inside it.
Rect apply_margins(const Rect& area, const Margins& m);

std::vector<Rect> split(const Rect& parent, Direction dir, const std::vector<Constraint>& constraints,
                        int spacing, const Margins& margins);
