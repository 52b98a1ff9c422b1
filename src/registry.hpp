#pragma once
/*
 * Registry
 *
 * Purpose: owns every widget record behind an opaque 64-bit id.
 * Id layout: (generation << 32) | (slot + 1); 0 is never a valid id.
 * Note: freeing bumps the slot generation so stale ids stop resolving.
 */
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include "widgets.hpp"

using WidgetId = uint64_t;
constexpr WidgetId NULL_WIDGET_ID = 0;

class Registry {
public:
  WidgetId create(WidgetData data);
  // False for unknown/stale ids or a kind mismatch.
  bool free(WidgetId id, WidgetKind kind);

  std::optional<WidgetKind> kind(WidgetId id) const;
  bool contains(WidgetId id, WidgetKind kind) const;
  const WidgetData* find(WidgetId id) const;

  template <class T> T* get(WidgetId id) {
    Slot* s = slot_for(id);
    return s ? std::get_if<T>(&*s->data) : nullptr;
  }
  template <class T> const T* get(WidgetId id) const {
    const Slot* s = slot_for(id);
    return s ? std::get_if<T>(&*s->data) : nullptr;
  }

  size_t live_count() const { return live_; }
  size_t slot_count() const { return slots_.size(); }

private:
  struct Slot {
    uint32_t generation = 1;
    std::optional<WidgetData> data;
  };
  Slot* slot_for(WidgetId id);
  const Slot* slot_for(WidgetId id) const;

  std::vector<Slot> slots_;
  std::vector<uint32_t> free_slots_;
  size_t live_ = 0;
};
