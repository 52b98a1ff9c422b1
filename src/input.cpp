#include "input.hpp"
#include "text.hpp"

bool Input::emit(KeyCode code, uint32_t ch, uint8_t mods, Event& out) {
  if (pending_esc_) mods |= KEYMOD_ALT;
  pending_esc_ = false;
  out = Event::key_event(code, ch, mods);
  return true;
}

bool Input::consume(int ch, Event& out) {
  if (utf8_left_ > 0) {
    if (ch >= 0 && (ch & 0xC0) == 0x80) {
      utf8_cp_ = (utf8_cp_ << 6) | static_cast<uint32_t>(ch & 0x3F);
      if (--utf8_left_ == 0) return emit(KeyCode::Char, utf8_cp_, KEYMOD_NONE, out);
      return false;
    }
    utf8_left_ = 0;
    return emit(KeyCode::Char, REPLACEMENT_CHAR, KEYMOD_NONE, out);
  }
  if (ch == 27) {
    if (pending_esc_) {
      // first ESC completes; the second stays pending
      out = Event::key_event(KeyCode::Esc);
      return true;
    }
    pending_esc_ = true;
    return false;
  }
  if (ch >= 0xC2 && ch <= 0xF4) {
    utf8_left_ = ch >= 0xF0 ? 3 : (ch >= 0xE0 ? 2 : 1);
    utf8_cp_ = static_cast<uint32_t>(ch) & (ch >= 0xF0 ? 0x07u : (ch >= 0xE0 ? 0x0Fu : 0x1Fu));
    return false;
  }
  switch (ch) {
    case '\n': case '\r': case KEY_ENTER: return emit(KeyCode::Enter, 0, KEYMOD_NONE, out);
    case KEY_LEFT: return emit(KeyCode::Left, 0, KEYMOD_NONE, out);
    case KEY_RIGHT: return emit(KeyCode::Right, 0, KEYMOD_NONE, out);
    case KEY_UP: return emit(KeyCode::Up, 0, KEYMOD_NONE, out);
    case KEY_DOWN: return emit(KeyCode::Down, 0, KEYMOD_NONE, out);
    case KEY_SLEFT: return emit(KeyCode::Left, 0, KEYMOD_SHIFT, out);
    case KEY_SRIGHT: return emit(KeyCode::Right, 0, KEYMOD_SHIFT, out);
    case KEY_BACKSPACE: case 127: case 8: return emit(KeyCode::Backspace, 0, KEYMOD_NONE, out);
    case '\t': return emit(KeyCode::Tab, 0, KEYMOD_NONE, out);
    case KEY_BTAB: return emit(KeyCode::Tab, 0, KEYMOD_SHIFT, out);
    case KEY_DC: return emit(KeyCode::Delete, 0, KEYMOD_NONE, out);
    case KEY_HOME: return emit(KeyCode::Home, 0, KEYMOD_NONE, out);
    case KEY_END: return emit(KeyCode::End, 0, KEYMOD_NONE, out);
    case KEY_PPAGE: return emit(KeyCode::PageUp, 0, KEYMOD_NONE, out);
    case KEY_NPAGE: return emit(KeyCode::PageDown, 0, KEYMOD_NONE, out);
    case KEY_IC: return emit(KeyCode::Insert, 0, KEYMOD_NONE, out);
    default: break;
  }
  if (ch >= KEY_F(1) && ch <= KEY_F(12))
    return emit(static_cast<KeyCode>(static_cast<uint32_t>(KeyCode::F1) + (ch - KEY_F(1))), 0, KEYMOD_NONE, out);
  if (ch >= 1 && ch <= 26)
    return emit(KeyCode::Char, static_cast<uint32_t>('a' + ch - 1), KEYMOD_CTRL, out);
  if (ch >= 0x20 && ch < 0x7F)
    return emit(KeyCode::Char, static_cast<uint32_t>(ch), KEYMOD_NONE, out);
  return false;
}

bool Input::flush(Event& out) {
  if (utf8_left_ > 0) {
    utf8_left_ = 0;
    return emit(KeyCode::Char, REPLACEMENT_CHAR, KEYMOD_NONE, out);
  }
  if (!pending_esc_) return false;
  pending_esc_ = false;
  out = Event::key_event(KeyCode::Esc);
  return true;
}

bool Input::pending() const { return pending_esc_ || utf8_left_ > 0; }

void Input::reset() {
  pending_esc_ = false;
  utf8_left_ = 0;
  utf8_cp_ = 0;
}

bool Input::translateMouse(const MEVENT& me, Event& out) {
  const mmask_t b = me.bstate;
  uint8_t mods = 0;
  if (b & BUTTON_SHIFT) mods |= KEYMOD_SHIFT;
  if (b & BUTTON_ALT) mods |= KEYMOD_ALT;
  if (b & BUTTON_CTRL) mods |= KEYMOD_CTRL;
  MouseKind kind;
  MouseButton btn = MouseButton::None;
  if (b & BUTTON4_PRESSED) kind = MouseKind::ScrollUp;
#ifdef BUTTON5_PRESSED
  else if (b & BUTTON5_PRESSED) kind = MouseKind::ScrollDown;
#endif
  else if (b & (BUTTON1_PRESSED | BUTTON1_CLICKED)) { kind = MouseKind::Down; btn = MouseButton::Left; }
  else if (b & (BUTTON3_PRESSED | BUTTON3_CLICKED)) { kind = MouseKind::Down; btn = MouseButton::Right; }
  else if (b & (BUTTON2_PRESSED | BUTTON2_CLICKED)) { kind = MouseKind::Down; btn = MouseButton::Middle; }
  else if (b & BUTTON1_RELEASED) { kind = MouseKind::Up; btn = MouseButton::Left; }
  else if (b & BUTTON3_RELEASED) { kind = MouseKind::Up; btn = MouseButton::Right; }
  else if (b & BUTTON2_RELEASED) { kind = MouseKind::Up; btn = MouseButton::Middle; }
  else if (b & REPORT_MOUSE_POSITION) kind = MouseKind::Moved;
  else return false;
  out = Event::mouse_event(kind, btn, me.x, me.y, mods);
  return true;
}
