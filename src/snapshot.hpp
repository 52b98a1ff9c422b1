#pragma once
/*
 * Snapshot
 *
 * Purpose: deterministic text/style/cell views of a rendered CellBuffer.
 * Format: rows joined by '\n' (no trailing newline); style views separate
 *         cells with a single space.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include "cell_buffer.hpp"

struct CellRecord {
  uint32_t codepoint;
  uint32_t fg;
  uint32_t bg;
  uint16_t mods;
};

std::string snapshot_text(const CellBuffer& buf);
// "FFBBMMMM" per cell, colors folded onto the Named palette (00 = Reset).
std::string snapshot_styles(const CellBuffer& buf);
// "FFFFFFFFBBBBBBBBMMMM" per cell using the full color encoding.
std::string snapshot_styles_ex(const CellBuffer& buf);
// Writes min(cells, cap) records row-major; returns the total cell count.
size_t snapshot_cells(const CellBuffer& buf, CellRecord* out, size_t cap);
