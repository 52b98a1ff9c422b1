#include "engine.hpp"
#include "event_queue.hpp"
#include "headless_terminal.hpp"
#include "input.hpp"
#include "session.hpp"
#include "snapshot.hpp"
#include <cassert>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

static void modes_are_idempotent() {
  auto term = std::make_unique<HeadlessTerminal>(10, 3, true);
  HeadlessTerminal* t = term.get();
  Session s(std::move(term));
  std::string err;

  assert(s.set_raw(true, err) && s.raw() && t->raw());
  assert(s.set_raw(true, err));
  assert(t->mode_switches() == 1);
  assert(s.set_alt_screen(true, err) && t->alt_screen());
  assert(s.set_alt_screen(true, err));
  assert(t->mode_switches() == 2);
  assert(s.set_raw(false, err) && !t->raw());
  assert(t->mode_switches() == 3);
}

static void non_interactive_target() {
  auto term = std::make_unique<HeadlessTerminal>(80, 24, false);
  HeadlessTerminal* t = term.get();
  Session s(std::move(term));
  std::string err;
  assert(!s.set_raw(true, err));
  assert(!err.empty());
  assert(!s.raw());
  err.clear();
  assert(!s.set_alt_screen(true, err));
  assert(!err.empty());
  assert(t->mode_switches() == 0);
  // leaving a mode that was never entered is a no-op
  assert(s.set_raw(false, err));
  assert(s.size().cols == 80 && s.size().rows == 24);
}

static void cursor_and_drawing() {
  auto term = std::make_unique<HeadlessTerminal>(10, 3, true);
  HeadlessTerminal* t = term.get();
  Session s(std::move(term));

  s.set_cursor(50, 50);
  assert(s.cursor_x() == 9 && s.cursor_y() == 2);
  assert(t->cursor_col() == 9 && t->cursor_row() == 2);
  s.show_cursor(false);
  assert(!t->cursor_visible());

  Registry reg;
  ParagraphState p;
  p.lines = lines_from_text("hi", Style{});
  WidgetId id = reg.create(std::move(p));
  Renderer r;
  std::string err;
  assert(s.draw(r, reg, {{WidgetKind::Paragraph, id, Rect{1, 1, 5, 1}}}, err) == RenderResult::Ok);
  assert(snapshot_text(s.frame()) == "          \n hi       \n          ");
  assert(t->screen() == s.frame());
  // presenting leaves the cursor where the caller put it
  assert(t->cursor_col() == 9 && t->cursor_row() == 2);

  // a rejected batch keeps both the front frame and the screen
  assert(reg.free(id, WidgetKind::Paragraph));
  assert(s.draw(r, reg, {{WidgetKind::Paragraph, id, Rect{0, 0, 5, 1}}}, err) == RenderResult::InvalidHandle);
  assert(s.frame().at(1, 1).codepoint == 'h');
  assert(t->screen().at(1, 1).codepoint == 'h');

  s.clear();
  assert(s.frame().at(1, 1).codepoint == ' ');
  assert(t->screen().at(1, 1).codepoint == ' ');
}

static void resize_events() {
  auto term = std::make_unique<HeadlessTerminal>(10, 5, true);
  HeadlessTerminal* t = term.get();
  Session s(std::move(term));
  s.set_cursor(8, 4);

  t->resize(4, 2);
  t->feed(Event::resize_event(4, 2));
  t->feed(Event::key_event(KeyCode::Char, 'x'));
  Event e;
  assert(s.read_event(e, 0));
  assert(e.kind == EventKind::Resize);
  assert(s.size().cols == 4 && s.size().rows == 2);
  assert(s.cursor_x() == 3 && s.cursor_y() == 1);
  assert(s.read_event(e, 0));
  assert(e.kind == EventKind::Key && e.ch == 'x');
  assert(!s.read_event(e, 0));

  Registry reg;
  Renderer r;
  std::string err;
  assert(s.draw(r, reg, {}, err) == RenderResult::Ok);
  assert(s.frame().width() == 4 && s.frame().height() == 2);
}

static void queue_order_and_timeout() {
  EventQueue q;
  Event e;
  assert(!q.try_pop(e));
  auto t0 = std::chrono::steady_clock::now();
  assert(!q.wait_pop(e, std::chrono::milliseconds(20)));
  assert(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(15));

  q.push(Event::key_event(KeyCode::Up));
  q.push(Event::resize_event(3, 4));
  q.push(Event::mouse_event(MouseKind::Down, MouseButton::Left, 1, 2));
  assert(q.size() == 3);
  assert(q.try_pop(e) && e.kind == EventKind::Key && e.key == KeyCode::Up);
  assert(q.try_pop(e) && e.kind == EventKind::Resize && e.width == 3 && e.height == 4);
  assert(q.wait_pop(e, std::chrono::milliseconds(0)) && e.kind == EventKind::Mouse && e.mouse_y == 2);

  std::thread producer([&q] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    q.push(Event::key_event(KeyCode::Enter));
  });
  assert(q.wait_pop(e, std::chrono::seconds(5)));
  assert(e.key == KeyCode::Enter);
  producer.join();

  q.push(Event::key_event(KeyCode::Tab));
  q.clear();
  assert(q.size() == 0);
}

static void input_decoding() {
  Input in;
  Event e;
  assert(in.consume('a', e) && e.key == KeyCode::Char && e.ch == 'a' && e.key_mods == 0);
  assert(in.consume(KEY_UP, e) && e.key == KeyCode::Up);
  assert(in.consume('\n', e) && e.key == KeyCode::Enter);
  assert(in.consume(KEY_F(3), e) && e.key == KeyCode::F3);
  assert(in.consume(3, e) && e.ch == 'c' && e.key_mods == KEYMOD_CTRL);

  // ESC followed by a key is ALT+key
  assert(!in.consume(27, e));
  assert(in.pending());
  assert(in.consume('x', e) && e.ch == 'x' && e.key_mods == KEYMOD_ALT);

  // a lone ESC surfaces when the read times out
  assert(!in.consume(27, e));
  assert(in.flush(e) && e.key == KeyCode::Esc);
  assert(!in.flush(e));

  // ESC ESC: the first completes, the second waits
  assert(!in.consume(27, e));
  assert(in.consume(27, e) && e.key == KeyCode::Esc && e.key_mods == 0);
  assert(in.pending());
  in.reset();
  assert(!in.pending());

  // multi-byte UTF-8 is reassembled
  assert(!in.consume(0xE2, e));
  assert(!in.consume(0x94, e));
  assert(in.consume(0x82, e) && e.ch == 0x2502);
  assert(!in.consume(0xC3, e));
  assert(in.consume('z', e) && e.ch == 0xFFFD);
}

static void failed_configure_keeps_settings() {
  EngineConfig good;
  good.default_raw = false;
  good.trace = true;
  Engine eng(good);
  spdlog::logger* before = &eng.log();

  EngineConfig bad;
  bad.default_raw = true;
  bad.default_alt_screen = true;
  bad.trace = false;
  bad.log_path = "/dev/null/tuibridge.log";
  std::string err;
  assert(!eng.configure(bad, err));
  assert(!err.empty());
  assert(!eng.config().default_raw && !eng.config().default_alt_screen);
  assert(eng.config().trace && eng.config().log_path.empty());
  assert(&eng.log() == before);

  // the kept defaults apply to the next session
  err.clear();
  assert(eng.open_session(std::make_unique<HeadlessTerminal>(4, 2, true), err));
  assert(!eng.session()->raw());
  eng.close_session();
}

int main() {
  modes_are_idempotent();
  non_interactive_target();
  cursor_and_drawing();
  resize_events();
  queue_order_and_timeout();
  input_decoding();
  failed_configure_keeps_settings();
  return 0;
}
