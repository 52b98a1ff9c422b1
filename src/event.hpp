#pragma once
/*
 * Event
 *
 * Purpose: input events as seen by callers (key, mouse, resize).
 * Note: codes are part of the C interface and must not be renumbered.
 */
#include <cstdint>

enum class EventKind : uint32_t { None = 0, Key = 1, Resize = 2, Mouse = 3 };

enum class KeyCode : uint32_t {
  Char = 0, Enter = 1, Left = 2, Right = 3, Up = 4, Down = 5, Esc = 6, Backspace = 7,
  Tab = 8, Delete = 9, Home = 10, End = 11, PageUp = 12, PageDown = 13, Insert = 14,
  F1 = 100, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
};

enum KeyMods : uint8_t { KEYMOD_NONE = 0, KEYMOD_SHIFT = 1, KEYMOD_ALT = 2, KEYMOD_CTRL = 4 };

enum class MouseKind : uint32_t { Down = 1, Up = 2, Drag = 3, Moved = 4, ScrollUp = 5, ScrollDown = 6 };
enum class MouseButton : uint32_t { None = 0, Left = 1, Right = 2, Middle = 3 };

struct Event {
  EventKind kind = EventKind::None;
  KeyCode key = KeyCode::Char;
  uint32_t ch = 0;
  uint8_t key_mods = 0;
  int width = 0;
  int height = 0;
  int mouse_x = 0;
  int mouse_y = 0;
  MouseKind mouse_kind = MouseKind::Moved;
  MouseButton mouse_button = MouseButton::None;
  uint8_t mouse_mods = 0;

  static Event key_event(KeyCode code, uint32_t ch = 0, uint8_t mods = 0) {
    Event e; e.kind = EventKind::Key; e.key = code; e.ch = ch; e.key_mods = mods; return e;
  }
  static Event resize_event(int w, int h) {
    Event e; e.kind = EventKind::Resize; e.width = w; e.height = h; return e;
  }
  static Event mouse_event(MouseKind k, MouseButton b, int x, int y, uint8_t mods = 0) {
    Event e; e.kind = EventKind::Mouse; e.mouse_kind = k; e.mouse_button = b; e.mouse_x = x; e.mouse_y = y; e.mouse_mods = mods; return e;
  }
};
