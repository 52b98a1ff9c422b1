#include "abi_common.hpp"
#include <algorithm>
#include <cstring>

TuibStatus fail(Engine& eng, TuibStatus st, const std::string& msg) {
  eng.log().warn("{}", msg);
  eng.set_last_error(msg);
  return st;
}

TuibStatus fail_exception(Engine& eng, std::unique_lock<std::mutex>& lk, const char* name, const char* what) {
  if (!lk.owns_lock()) lk.lock();
  eng.log().error("{}: internal failure: {}", name, what);
  eng.set_last_error(std::string(name) + ": internal failure: " + what);
  return TUIB_ERR_INTERNAL;
}

Rect to_rect(const TuibRect& r) {
  constexpr int kMax = UINT16_MAX;
  return Rect{r.x, r.y, std::min<int>(r.width, kMax - r.x), std::min<int>(r.height, kMax - r.y)};
}

TuibRect to_abi_rect(const Rect& r) {
  auto clamp16 = [](int v) { return static_cast<uint16_t>(std::clamp(v, 0, static_cast<int>(UINT16_MAX))); };
  return TuibRect{clamp16(r.x), clamp16(r.y), clamp16(r.width), clamp16(r.height)};
}

Style to_style(const TuibStyle& s) {
  Style st;
  st.fg = decode_color(s.fg);
  st.bg = decode_color(s.bg);
  st.mods = static_cast<uint16_t>(s.mods & MOD_ALL);
  return st;
}

bool to_alignment(uint32_t raw, Alignment& out) {
  if (raw > static_cast<uint32_t>(Alignment::Right)) return false;
  out = static_cast<Alignment>(raw);
  return true;
}

TuibStatus read_text(Engine& eng, const char* name, const char* text, size_t len, std::string& out) {
  if (!text && len > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null text with non-zero length");
  std::string err;
  if (!eng.check_text(len, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out = sanitize_utf8(text, len);
  return TUIB_OK;
}

TuibStatus read_spans(Engine& eng, const char* name, const TuibSpan* spans, size_t n, std::vector<Span>& out) {
  if (!spans && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null span array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.clear();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    Span sp;
    TuibStatus st = read_text(eng, name, spans[i].text, spans[i].len, sp.text);
    if (st != TUIB_OK) return st;
    sp.style = to_style(spans[i].style);
    out.push_back(std::move(sp));
  }
  return TUIB_OK;
}

TuibStatus read_line(Engine& eng, const char* name, const TuibLine& line, Line& out) {
  return read_spans(eng, name, line.spans, line.count, out.spans);
}

TuibStatus read_lines(Engine& eng, const char* name, const TuibLine* lines, size_t n, std::vector<Line>& out) {
  if (!lines && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null line array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.clear();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    Line l;
    TuibStatus st = read_line(eng, name, lines[i], l);
    if (st != TUIB_OK) return st;
    out.push_back(std::move(l));
  }
  return TUIB_OK;
}

TuibStatus read_block(Engine& eng, const char* name, const TuibBlock* block, const TuibSpan* title, size_t n,
                      BlockSpec& out) {
  if (!block) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null block");
  if (block->border_type > static_cast<uint32_t>(BorderType::QuadrantOutside) ||
      !to_alignment(block->title_alignment, out.title_alignment))
    return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": bad border type or title alignment");
  out.borders = static_cast<uint8_t>(block->borders & BORDER_ALL);
  out.border_type = static_cast<BorderType>(block->border_type);
  out.border_style = to_style(block->border_style);
  out.pad_left = block->pad_left;
  out.pad_top = block->pad_top;
  out.pad_right = block->pad_right;
  out.pad_bottom = block->pad_bottom;
  return read_spans(eng, name, title, n, out.title.spans);
}

TuibStatus read_commands(Engine& eng, const char* name, const TuibDrawCmd* cmds, size_t n,
                         std::vector<DrawCommand>& out) {
  if (!cmds && n > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null command array");
  std::string err;
  if (!eng.check_batch(n, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  out.clear();
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    const TuibDrawCmd& c = cmds[i];
    if (!widget_kind_valid(c.kind))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": unknown widget kind " + std::to_string(c.kind));
    out.push_back(DrawCommand{static_cast<WidgetKind>(c.kind), c.handle,
                              to_rect(c.rect)});
  }
  return TUIB_OK;
}

TuibStatus render_status(Engine& eng, const char* name, RenderResult r, const std::string& err) {
  switch (r) {
    case RenderResult::Ok: return TUIB_OK;
    case RenderResult::InvalidKind: return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": " + err);
    case RenderResult::InvalidHandle: return fail(eng, TUIB_ERR_INVALID_HANDLE, std::string(name) + ": " + err);
  }
  return TUIB_ERR_INTERNAL;
}

TuibStatus copy_out(Engine& eng, const char* name, const std::string& s, char* buf, size_t cap, size_t* out_len) {
  if (out_len) *out_len = s.size();
  if (!buf || cap <= s.size()) {
    if (buf && cap > 0) buf[0] = '\0';
    return fail(eng, TUIB_ERR_CAPACITY,
                std::string(name) + ": buffer of " + std::to_string(cap) + " bytes, need " + std::to_string(s.size() + 1));
  }
  std::memcpy(buf, s.data(), s.size());
  buf[s.size()] = '\0';
  return TUIB_OK;
}
