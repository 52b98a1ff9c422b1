#include <algorithm>
#include "abi_common.hpp"
#include "headless_terminal.hpp"
#include "ncurses_terminal.hpp"

template <class F>
static TuibStatus with_session(const char* name, F&& body) {
  return guarded(name, [&](Engine& eng) {
    Session* s = eng.session();
    if (!s) return fail(eng, TUIB_ERR_NO_SESSION, std::string(name) + ": no terminal session");
    return body(eng, *s);
  });
}

static TuibStatus mode_status(Engine& eng, const char* name, bool ok, const std::string& err) {
  if (ok) return TUIB_OK;
  return fail(eng, TUIB_ERR_TERMINAL_UNAVAILABLE, std::string(name) + ": " + err);
}

static TuibEvent to_abi_event(const Event& e) {
  TuibEvent out{};
  out.kind = static_cast<uint32_t>(e.kind);
  out.key = TuibKeyEvent{static_cast<uint32_t>(e.key), e.ch, e.key_mods};
  out.width = static_cast<uint16_t>(e.width);
  out.height = static_cast<uint16_t>(e.height);
  out.mouse_x = static_cast<uint16_t>(e.mouse_x);
  out.mouse_y = static_cast<uint16_t>(e.mouse_y);
  out.mouse_kind = e.kind == EventKind::Mouse ? static_cast<uint32_t>(e.mouse_kind) : 0;
  out.mouse_btn = static_cast<uint32_t>(e.mouse_button);
  out.mouse_mods = e.mouse_mods;
  return out;
}

static bool valid_key_code(uint32_t code) {
  return code <= static_cast<uint32_t>(KeyCode::Insert) ||
         (code >= static_cast<uint32_t>(KeyCode::F1) && code <= static_cast<uint32_t>(KeyCode::F12));
}

extern "C" {

TuibStatus tuib_terminal_init(void) {
  return guarded("tuib_terminal_init", [&](Engine& eng) {
    if (eng.session()) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_terminal_init: a session is already open");
    std::string err;
    std::unique_ptr<ITerminal> term = open_live_terminal(err);
    if (!term) {
      // no device: keep going offscreen; mode switches will report unavailable
      eng.log().warn("tuib_terminal_init: {}; using an offscreen terminal", err);
      term = std::make_unique<HeadlessTerminal>(TUIB_FALLBACK_COLS, TUIB_FALLBACK_ROWS, false);
    }
    if (!eng.open_session(std::move(term), err)) return fail(eng, TUIB_ERR_INTERNAL, "tuib_terminal_init: " + err);
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_init_headless(uint16_t width, uint16_t height, bool interactive) {
  return guarded("tuib_terminal_init_headless", [&](Engine& eng) {
    std::string err;
    if (!eng.check_size(width, height, err)) return fail(eng, TUIB_ERR_LIMIT, "tuib_terminal_init_headless: " + err);
    if (!eng.open_session(std::make_unique<HeadlessTerminal>(width, height, interactive), err))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_terminal_init_headless: " + err);
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_free(void) {
  return with_session("tuib_terminal_free", [](Engine& eng, Session&) {
    eng.close_session();
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_enable_raw(void) {
  return with_session("tuib_terminal_enable_raw", [](Engine& eng, Session& s) {
    std::string err;
    return mode_status(eng, "tuib_terminal_enable_raw", s.set_raw(true, err), err);
  });
}

TuibStatus tuib_terminal_disable_raw(void) {
  return with_session("tuib_terminal_disable_raw", [](Engine& eng, Session& s) {
    std::string err;
    return mode_status(eng, "tuib_terminal_disable_raw", s.set_raw(false, err), err);
  });
}

TuibStatus tuib_terminal_enter_alt(void) {
  return with_session("tuib_terminal_enter_alt", [](Engine& eng, Session& s) {
    std::string err;
    return mode_status(eng, "tuib_terminal_enter_alt", s.set_alt_screen(true, err), err);
  });
}

TuibStatus tuib_terminal_leave_alt(void) {
  return with_session("tuib_terminal_leave_alt", [](Engine& eng, Session& s) {
    std::string err;
    return mode_status(eng, "tuib_terminal_leave_alt", s.set_alt_screen(false, err), err);
  });
}

TuibStatus tuib_terminal_set_cursor(uint16_t x, uint16_t y) {
  return with_session("tuib_terminal_set_cursor", [&](Engine&, Session& s) {
    s.set_cursor(x, y);
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_get_cursor(uint16_t* x, uint16_t* y) {
  return with_session("tuib_terminal_get_cursor", [&](Engine& eng, Session& s) {
    if (!x || !y) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_terminal_get_cursor: null output");
    *x = static_cast<uint16_t>(s.cursor_x());
    *y = static_cast<uint16_t>(s.cursor_y());
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_show_cursor(bool visible) {
  return with_session("tuib_terminal_show_cursor", [&](Engine&, Session& s) {
    s.show_cursor(visible);
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_size(uint16_t* width, uint16_t* height) {
  return with_session("tuib_terminal_size", [&](Engine& eng, Session& s) {
    if (!width || !height) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_terminal_size: null output");
    *width = static_cast<uint16_t>(s.size().cols);
    *height = static_cast<uint16_t>(s.size().rows);
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_clear(void) {
  return with_session("tuib_terminal_clear", [](Engine&, Session& s) {
    s.clear();
    return TUIB_OK;
  });
}

TuibStatus tuib_terminal_draw_frame(const TuibDrawCmd* cmds, size_t n) {
  return with_session("tuib_terminal_draw_frame", [&](Engine& eng, Session& s) {
    std::vector<DrawCommand> batch;
    TuibStatus st = read_commands(eng, "tuib_terminal_draw_frame", cmds, n, batch);
    if (st != TUIB_OK) return st;
    std::string err;
    RenderResult r = s.draw(eng.renderer(), eng.registry(), batch, err);
    return render_status(eng, "tuib_terminal_draw_frame", r, err);
  });
}

TuibStatus tuib_next_event(uint64_t timeout_ms, TuibEvent* out) {
  return guarded_unlocked("tuib_next_event", [&](Engine& eng) {
    if (!out) {
      std::lock_guard<std::mutex> lk(eng.mutex());
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_next_event: null output");
    }
    Event e;
    const int timeout = static_cast<int>(std::min<uint64_t>(timeout_ms, 24u * 3600u * 1000u));
    if (!eng.next_event(e, timeout)) e = Event{};
    *out = to_abi_event(e);
    return TUIB_OK;
  });
}

TuibStatus tuib_inject_key(uint32_t code, uint32_t ch, uint8_t mods) {
  return guarded("tuib_inject_key", [&](Engine& eng) {
    if (!valid_key_code(code)) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_inject_key: unknown key code");
    eng.events().push(Event::key_event(static_cast<KeyCode>(code), ch, static_cast<uint8_t>(mods & 7)));
    return TUIB_OK;
  });
}

TuibStatus tuib_inject_resize(uint16_t width, uint16_t height) {
  return guarded("tuib_inject_resize", [&](Engine& eng) {
    eng.events().push(Event::resize_event(width, height));
    return TUIB_OK;
  });
}

TuibStatus tuib_inject_mouse(uint32_t kind, uint32_t button, uint16_t x, uint16_t y, uint8_t mods) {
  return guarded("tuib_inject_mouse", [&](Engine& eng) {
    if (kind < static_cast<uint32_t>(MouseKind::Down) || kind > static_cast<uint32_t>(MouseKind::ScrollDown) ||
        button > static_cast<uint32_t>(MouseButton::Middle))
      return fail(eng, TUIB_ERR_INVALID_ARGUMENT, "tuib_inject_mouse: bad kind or button");
    eng.events().push(Event::mouse_event(static_cast<MouseKind>(kind), static_cast<MouseButton>(button), x, y,
                                         static_cast<uint8_t>(mods & 7)));
    return TUIB_OK;
  });
}

}
