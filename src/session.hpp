#pragma once
/*
 * Session
 *
 * Purpose: the single terminal session: modes, cursor, known size, front frame.
 * Contract: raw/alt toggles are idempotent; cursor positions are clipped to the
 *           known size; the front frame is replaced only by a successful draw.
 */
#include <memory>
#include <string>
#include <vector>
#include "cell_buffer.hpp"
#include "iterminal.hpp"
#include "registry.hpp"
#include "renderer.hpp"

class Session {
public:
  explicit Session(std::unique_ptr<ITerminal> term);
  ~Session();

  bool set_raw(bool on, std::string& err);
  bool set_alt_screen(bool on, std::string& err);
  bool raw() const { return raw_; }
  bool alt_screen() const { return alt_; }

  TermSize size() const { return size_; }
  void set_cursor(int x, int y);
  int cursor_x() const { return cursor_x_; }
  int cursor_y() const { return cursor_y_; }
  void show_cursor(bool visible);
  bool cursor_visible() const { return cursor_visible_; }
  void clear();

  RenderResult draw(const Renderer& r, const Registry& reg, const std::vector<DrawCommand>& cmds, std::string& err);
  const CellBuffer& frame() const { return front_; }

  // Input from the device; a Resize also updates the known size.
  bool read_event(Event& out, int timeout_ms);
  void observe(const Event& e);

  ITerminal& terminal() { return *term_; }

private:
  void present(const CellBuffer& next);

  std::unique_ptr<ITerminal> term_;
  TermSize size_;
  CellBuffer front_;
  bool raw_ = false;
  bool alt_ = false;
  bool cursor_visible_ = true;
  bool full_redraw_ = true;
  int cursor_x_ = 0;
  int cursor_y_ = 0;
};
