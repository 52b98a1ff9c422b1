#include "abi_common.hpp"

static bool to_constraint(const TuibConstraint& c, bool allow_extended, Constraint& out) {
  switch (c.kind) {
    case TUIB_CONSTRAINT_LENGTH: out = Constraint::fixed(c.a); return true;
    case TUIB_CONSTRAINT_PERCENTAGE: out = Constraint::percent(c.a); return true;
    case TUIB_CONSTRAINT_MIN: out = Constraint::min(c.a); return true;
    case TUIB_CONSTRAINT_RATIO:
      if (!allow_extended) return false;
      out = Constraint::ratio(c.a, c.b);
      return true;
    case TUIB_CONSTRAINT_MAX:
      if (!allow_extended) return false;
      out = Constraint::max(c.a);
      return true;
    default: return false;
  }
}

static TuibStatus do_split(const char* name, bool allow_extended, TuibRect parent, uint32_t direction,
                           const TuibConstraint* cons, size_t n, int spacing, const Margins& margins,
                           TuibRect* out, size_t cap, size_t* out_count) {
  return guarded(name, [&](Engine& eng) {
    if (direction > TUIB_DIRECTION_HORIZONTAL)
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": bad direction");
    if (!cons && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null constraints");
    std::string err;
    if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
    std::vector<Constraint> cs;
    cs.reserve(n);
    for (size_t i = 0; i < n; ++i) {
      Constraint c;
      if (!to_constraint(cons[i], allow_extended, c))
        return fail(eng, TUIB_ERR_INVALID_ARGUMENT,
                    std::string(name) + ": constraint kind " + std::to_string(cons[i].kind) + " not accepted here");
      cs.push_back(c);
    }
    std::vector<Rect> rects = split(to_rect(parent), static_cast<Direction>(direction), cs, spacing, margins);
    if (out_count) *out_count = rects.size();
    if (!out && cap > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null output array");
    const size_t k = std::min(cap, rects.size());
    for (size_t i = 0; i < k; ++i)
      out[i] = to_abi_rect(rects[i]);
    if (k < rects.size())
      return fail(eng, TUIB_ERR_CAPACITY, std::string(name) + ": output holds " + std::to_string(cap) + " of " +
                                              std::to_string(rects.size()) + " rects");
    return TUIB_OK;
  });
}

extern "C" {

TuibStatus tuib_layout_split(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                             uint16_t margin_left, uint16_t margin_top, uint16_t margin_right, uint16_t margin_bottom,
                             TuibRect* out, size_t cap, size_t* out_count) {
  // legacy form: one uniform margin, the average of the four
  int m = (margin_left + margin_top + margin_right + margin_bottom) / 4;
  return do_split("tuib_layout_split", false, parent, direction, cons, n, 0, Margins{m, m, m, m}, out, cap, out_count);
}

TuibStatus tuib_layout_split_ex(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                                uint16_t spacing, uint16_t margin_left, uint16_t margin_top, uint16_t margin_right,
                                uint16_t margin_bottom, TuibRect* out, size_t cap, size_t* out_count) {
  return do_split("tuib_layout_split_ex", false, parent, direction, cons, n, spacing,
                  Margins{margin_left, margin_top, margin_right, margin_bottom}, out, cap, out_count);
}

TuibStatus tuib_layout_split_ex2(TuibRect parent, uint32_t direction, const TuibConstraint* cons, size_t n,
                                 uint16_t spacing, uint16_t margin_left, uint16_t margin_top, uint16_t margin_right,
                                 uint16_t margin_bottom, TuibRect* out, size_t cap, size_t* out_count) {
  return do_split("tuib_layout_split_ex2", true, parent, direction, cons, n, spacing,
                  Margins{margin_left, margin_top, margin_right, margin_bottom}, out, cap, out_count);
}

}
