#include "abi_common.hpp"
#include "snapshot.hpp"

static TuibStatus render_headless(Engine& eng, const char* name, uint16_t width, uint16_t height,
                                  const TuibDrawCmd* cmds, size_t n) {
  std::string err;
  if (!eng.check_size(width, height, err)) return fail(eng, TUIB_ERR_LIMIT, std::string(name) + ": " + err);
  std::vector<DrawCommand> batch;
  TuibStatus st = read_commands(eng, name, cmds, n, batch);
  if (st != TUIB_OK) return st;
  RenderResult r = eng.renderer().render(eng.registry(), batch, width, height, eng.headless_frame(), err);
  return render_status(eng, name, r, err);
}

static const CellBuffer* snapshot_source(Engine& eng, const char* name, uint32_t source, TuibStatus& st) {
  st = TUIB_OK;
  if (source == TUIB_SNAPSHOT_HEADLESS) return &eng.headless_frame();
  if (source == TUIB_SNAPSHOT_SESSION) {
    if (eng.session()) return &eng.session()->frame();
    st = fail(eng, TUIB_ERR_NO_SESSION, std::string(name) + ": no terminal session");
    return nullptr;
  }
  st = fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": unknown snapshot source");
  return nullptr;
}

template <class Derive>
static TuibStatus snapshot_string(const char* name, uint32_t source, char* buf, size_t cap, size_t* out_len,
                                  Derive&& derive) {
  return guarded(name, [&](Engine& eng) {
    TuibStatus st;
    const CellBuffer* frame = snapshot_source(eng, name, source, st);
    if (!frame) return st;
    return copy_out(eng, name, derive(*frame), buf, cap, out_len);
  });
}

extern "C" {

TuibStatus tuib_headless_render(uint16_t width, uint16_t height, const TuibDrawCmd* cmds, size_t n) {
  return guarded("tuib_headless_render", [&](Engine& eng) {
    return render_headless(eng, "tuib_headless_render", width, height, cmds, n);
  });
}

TuibStatus tuib_headless_render_text(uint16_t width, uint16_t height, const TuibDrawCmd* cmds, size_t n,
                                     char* buf, size_t cap, size_t* out_len) {
  return guarded("tuib_headless_render_text", [&](Engine& eng) {
    TuibStatus st = render_headless(eng, "tuib_headless_render_text", width, height, cmds, n);
    if (st != TUIB_OK) return st;
    return copy_out(eng, "tuib_headless_render_text", snapshot_text(eng.headless_frame()), buf, cap, out_len);
  });
}

TuibStatus tuib_snapshot_text(uint32_t source, char* buf, size_t cap, size_t* out_len) {
  return snapshot_string("tuib_snapshot_text", source, buf, cap, out_len, snapshot_text);
}

TuibStatus tuib_snapshot_styles(uint32_t source, char* buf, size_t cap, size_t* out_len) {
  return snapshot_string("tuib_snapshot_styles", source, buf, cap, out_len, snapshot_styles);
}

TuibStatus tuib_snapshot_styles_ex(uint32_t source, char* buf, size_t cap, size_t* out_len) {
  return snapshot_string("tuib_snapshot_styles_ex", source, buf, cap, out_len, snapshot_styles_ex);
}

TuibStatus tuib_snapshot_cells(uint32_t source, TuibCellInfo* out, size_t cap, size_t* out_required) {
  return guarded("tuib_snapshot_cells", [&](Engine& eng) {
    TuibStatus st;
    const CellBuffer* frame = snapshot_source(eng, "tuib_snapshot_cells", source, st);
    if (!frame) return st;
    if (!out && cap > 0) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_snapshot_cells: null output array");
    std::vector<CellRecord> records(std::min(cap, static_cast<size_t>(frame->width()) * frame->height()));
    const size_t total = snapshot_cells(*frame, records.data(), records.size());
    for (size_t i = 0; i < records.size(); ++i)
      out[i] = TuibCellInfo{records[i].codepoint, records[i].fg, records[i].bg, records[i].mods};
    if (out_required) *out_required = total;
    if (records.size() < total)
      return fail(eng, TUIB_ERR_CAPACITY, "tuib_snapshot_cells: filled " + std::to_string(records.size()) + " of " +
                                              std::to_string(total) + " cells");
    return TUIB_OK;
  });
}

}
