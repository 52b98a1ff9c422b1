#include "abi_common.hpp"
#include "config.hpp"

extern "C" {

void tuib_version(uint32_t* major, uint32_t* minor, uint32_t* patch) {
  if (major) *major = TUIB_VERSION_MAJOR;
  if (minor) *minor = TUIB_VERSION_MINOR;
  if (patch) *patch = TUIB_VERSION_PATCH;
}

uint32_t tuib_feature_bits(void) {
  uint32_t bits = TUIB_FEATURE_STYLE_DUMP_EX | TUIB_FEATURE_BATCH_TABLE_ROWS | TUIB_FEATURE_BATCH_LIST_ITEMS |
                  TUIB_FEATURE_COLOR_HELPERS | TUIB_FEATURE_AXIS_LABELS | TUIB_FEATURE_SPAN_SETTERS;
#if TUIB_ENABLE_SCROLLBAR
  bits |= TUIB_FEATURE_SCROLLBAR;
#endif
#if TUIB_ENABLE_CANVAS
  bits |= TUIB_FEATURE_CANVAS;
#endif
  return bits;
}

uint32_t tuib_color_rgb(uint8_t r, uint8_t g, uint8_t b) { return color_rgb(r, g, b); }
uint32_t tuib_color_indexed(uint8_t index) { return color_indexed(index); }
uint32_t tuib_color_named(uint8_t index) { return color_named(index); }

TuibStatus tuib_engine_configure(const TuibConfig* cfg) {
  return guarded("tuib_engine_configure", [&](Engine& eng) {
    if (!cfg) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_engine_configure: null config");
    EngineConfig c;
    c.default_raw = cfg->default_raw;
    c.default_alt_screen = cfg->default_alt_screen;
    c.trace = cfg->trace;
    c.log_append = cfg->log_append;
    TuibStatus st = read_text(eng, "tuib_engine_configure", cfg->log_path, cfg->log_path ? cfg->log_path_len : 0, c.log_path);
    if (st != TUIB_OK) return st;
    std::string err;
    if (!eng.configure(c, err)) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_engine_configure: " + err);
    return TUIB_OK;
  });
}

TuibStatus tuib_last_error(char* buf, size_t cap, size_t* out_len) {
  return guarded("tuib_last_error", [&](Engine& eng) {
    const std::string& msg = eng.last_error();
    if (out_len) *out_len = msg.size();
    if (!buf || cap <= msg.size()) {
      if (buf && cap > 0) buf[0] = '\0';
      return TUIB_ERR_CAPACITY;
    }
    msg.copy(buf, msg.size());
    buf[msg.size()] = '\0';
    return TUIB_OK;
  });
}

void tuib_clear_last_error(void) {
  (void)guarded("tuib_clear_last_error", [](Engine& eng) {
    eng.clear_last_error();
    return TUIB_OK;
  });
}

TuibStatus tuib_set_safety(bool enabled) {
  return guarded("tuib_set_safety", [&](Engine& eng) {
    eng.caps().enabled = enabled;
    eng.log().info("safety caps {}", enabled ? "on" : "off");
    return TUIB_OK;
  });
}

TuibStatus tuib_set_caps(uint32_t max_width, uint32_t max_height, uint64_t max_area, size_t max_text_len,
                         size_t max_batch) {
  return guarded("tuib_set_caps", [&](Engine& eng) {
    SafetyCaps& c = eng.caps();
    c.max_width = std::max<uint32_t>(1, max_width);
    c.max_height = std::max<uint32_t>(1, max_height);
    c.max_area = std::max<uint64_t>(1, max_area);
    c.max_text_len = std::max<size_t>(1, max_text_len);
    c.max_batch = std::max<size_t>(1, max_batch);
    return TUIB_OK;
  });
}

}
