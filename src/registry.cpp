#include "registry.hpp"
#include <limits>

static WidgetId make_id(uint32_t slot, uint32_t generation) {
  return (static_cast<WidgetId>(generation) << 32) | (static_cast<WidgetId>(slot) + 1);
}

WidgetId Registry::create(WidgetData data) {
  uint32_t idx;
  if (!free_slots_.empty()) {
    idx = free_slots_.back();
    free_slots_.pop_back();
  } else {
    idx = static_cast<uint32_t>(slots_.size());
    slots_.emplace_back();
  }
  Slot& s = slots_[idx];
  s.data = std::move(data);
  ++live_;
  return make_id(idx, s.generation);
}

Registry::Slot* Registry::slot_for(WidgetId id) {
  return const_cast<Slot*>(static_cast<const Registry*>(this)->slot_for(id));
}

const Registry::Slot* Registry::slot_for(WidgetId id) const {
  uint32_t low = static_cast<uint32_t>(id & 0xFFFFFFFFu);
  uint32_t gen = static_cast<uint32_t>(id >> 32);
  if (low == 0) return nullptr;
  uint32_t idx = low - 1;
  if (idx >= slots_.size()) return nullptr;
  const Slot& s = slots_[idx];
  if (!s.data || s.generation != gen) return nullptr;
  return &s;
}

bool Registry::free(WidgetId id, WidgetKind kind) {
  Slot* s = slot_for(id);
  if (!s || kind_of(*s->data) != kind) return false;
  s->data.reset();
  --live_;
  uint32_t idx = static_cast<uint32_t>((id & 0xFFFFFFFFu) - 1);
  // a slot whose generation would wrap is retired instead of reused
  if (s->generation == std::numeric_limits<uint32_t>::max()) return true;
  ++s->generation;
  free_slots_.push_back(idx);
  return true;
}

std::optional<WidgetKind> Registry::kind(WidgetId id) const {
  const Slot* s = slot_for(id);
  if (!s) return std::nullopt;
  return kind_of(*s->data);
}

bool Registry::contains(WidgetId id, WidgetKind k) const {
  auto got = kind(id);
  return got && *got == k;
}

const WidgetData* Registry::find(WidgetId id) const {
  const Slot* s = slot_for(id);
  return s ? &*s->data : nullptr;
}
