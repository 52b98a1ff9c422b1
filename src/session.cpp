#include "session.hpp"

Session::Session(std::unique_ptr<ITerminal> term) : term_(std::move(term)), size_(term_->getSize()) {
  front_.resize(size_.cols, size_.rows);
}

Session::~Session() {
  std::string ignored;
  // hand the tty back in the state the session found it
  if (alt_) (void)term_->set_alt_screen(false, ignored);
  if (raw_) (void)term_->set_raw(false, ignored);
  if (!cursor_visible_) term_->show_cursor(true);
}

bool Session::set_raw(bool on, std::string& err) {
  if (on == raw_) return true;
  if (!term_->set_raw(on, err)) return false;
  raw_ = on;
  return true;
}

bool Session::set_alt_screen(bool on, std::string& err) {
  if (on == alt_) return true;
  if (!term_->set_alt_screen(on, err)) return false;
  alt_ = on;
  full_redraw_ = true;
  return true;
}

void Session::set_cursor(int x, int y) {
  cursor_x_ = std::clamp(x, 0, std::max(0, size_.cols - 1));
  cursor_y_ = std::clamp(y, 0, std::max(0, size_.rows - 1));
  term_->move_cursor(cursor_y_, cursor_x_);
  term_->refresh();
}

void Session::show_cursor(bool visible) {
  cursor_visible_ = visible;
  term_->show_cursor(visible);
  term_->refresh();
}

void Session::clear() {
  term_->clear();
  term_->refresh();
  front_.reset();
}

RenderResult Session::draw(const Renderer& r, const Registry& reg, const std::vector<DrawCommand>& cmds, std::string& err) {
  CellBuffer next;
  RenderResult res = r.render(reg, cmds, size_.cols, size_.rows, next, err);
  if (res != RenderResult::Ok) return res;
  present(next);
  front_ = std::move(next);
  return res;
}

void Session::present(const CellBuffer& next) {
  const bool full = full_redraw_ || next.width() != front_.width() || next.height() != front_.height();
  if (full) term_->clear();
  for (int y = 0; y < next.height(); ++y) {
    const Cell* row = next.row(y);
    if (!full && std::equal(row, row + next.width(), front_.row(y))) continue;
    term_->draw_cells(y, 0, row, next.width());
  }
  term_->move_cursor(cursor_y_, cursor_x_);
  term_->refresh();
  full_redraw_ = false;
}

bool Session::read_event(Event& out, int timeout_ms) {
  if (!term_->read_event(out, timeout_ms)) return false;
  observe(out);
  return true;
}

void Session::observe(const Event& e) {
  if (e.kind != EventKind::Resize) return;
  size_ = TermSize{std::max(0, e.height), std::max(0, e.width)};
  full_redraw_ = true;
  cursor_x_ = std::clamp(cursor_x_, 0, std::max(0, size_.cols - 1));
  cursor_y_ = std::clamp(cursor_y_, 0, std::max(0, size_.rows - 1));
}
