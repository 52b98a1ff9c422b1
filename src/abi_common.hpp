#pragma once
/*
 * ABI plumbing
 *
 * Purpose: helpers shared by the exported C functions: the call guard,
 *          handle resolution and borrowed-input ingestion.
 * Rule: nothing thrown inside a body escapes; it becomes TUIB_ERR_INTERNAL.
 */
#include <cstddef>
#include <mutex>
#include <new>
#include <string>
#include <utility>
#include <vector>
#include "engine.hpp"
#include "layout.hpp"
#include "tuibridge.h"

TuibStatus fail(Engine& eng, TuibStatus st, const std::string& msg);
// Takes the engine lock if the failing call does not already hold it.
TuibStatus fail_exception(Engine& eng, std::unique_lock<std::mutex>& lk, const char* name, const char* what);

template <bool Locked, class F>
TuibStatus run_guarded(const char* name, F&& body) {
  Engine& eng = Engine::instance();
  std::unique_lock<std::mutex> lk(eng.mutex(), std::defer_lock);
  TuibStatus st = TUIB_ERR_INTERNAL;
  bool trace = false;
  try {
    lk.lock();
    trace = eng.config().trace;
    if (trace) eng.log().trace("ENTER {}", name);
    if (!Locked) lk.unlock();
    st = body(eng);
  } catch (const std::bad_alloc&) {
    st = fail_exception(eng, lk, name, "out of memory");
  } catch (const std::exception& e) {
    st = fail_exception(eng, lk, name, e.what());
  } catch (...) {
    st = fail_exception(eng, lk, name, "unknown exception");
  }
  if (trace) {
    if (!lk.owns_lock()) lk.lock();
    eng.log().trace("EXIT {} -> {}", name, static_cast<int>(st));
  }
  return st;
}

// Holds the engine lock for the whole call.
template <class F>
TuibStatus guarded(const char* name, F&& body) { return run_guarded<true>(name, std::forward<F>(body)); }

// For the one call that may block; the body takes the lock itself where needed.
template <class F>
TuibStatus guarded_unlocked(const char* name, F&& body) { return run_guarded<false>(name, std::forward<F>(body)); }

template <class T, class F>
TuibStatus with_widget(const char* name, uint64_t id, F&& body) {
  return guarded(name, [&](Engine& eng) {
    T* w = eng.registry().get<T>(id);
    if (!w) return fail(eng, TUIB_ERR_INVALID_HANDLE, std::string(name) + ": stale or wrong-kind handle");
    return body(eng, *w);
  });
}

template <class T, class Handle>
TuibStatus create_widget(const char* name, Handle* out, T state) {
  return guarded(name, [&](Engine& eng) {
    if (!out) return fail(eng, TUIB_ERR_INVALID_ARGUMENT, std::string(name) + ": null out handle");
    out->id = eng.registry().create(std::move(state));
    eng.log().debug("{}: created {} id={:#x}", name, widget_kind_name(WidgetKindOf<T>::value), out->id);
    return TUIB_OK;
  });
}

template <class T>
TuibStatus free_widget(const char* name, uint64_t id) {
  return guarded(name, [&](Engine& eng) {
    if (!eng.registry().free(id, WidgetKindOf<T>::value))
      return fail(eng, TUIB_ERR_INVALID_HANDLE, std::string(name) + ": stale or wrong-kind handle");
    eng.log().debug("{}: freed id={:#x}", name, id);
    return TUIB_OK;
  });
}

Style to_style(const TuibStyle& s);
// Trims the rect so its right and bottom edges stay within the 16-bit coordinate space.
Rect to_rect(const TuibRect& r);
TuibRect to_abi_rect(const Rect& r);
bool to_alignment(uint32_t raw, Alignment& out);

TuibStatus read_text(Engine& eng, const char* name, const char* text, size_t len, std::string& out);
TuibStatus read_spans(Engine& eng, const char* name, const TuibSpan* spans, size_t n, std::vector<Span>& out);
TuibStatus read_line(Engine& eng, const char* name, const TuibLine& line, Line& out);
TuibStatus read_lines(Engine& eng, const char* name, const TuibLine* lines, size_t n, std::vector<Line>& out);
TuibStatus read_block(Engine& eng, const char* name, const TuibBlock* block, const TuibSpan* title, size_t n,
                      BlockSpec& out);
TuibStatus read_commands(Engine& eng, const char* name, const TuibDrawCmd* cmds, size_t n,
                         std::vector<DrawCommand>& out);
TuibStatus render_status(Engine& eng, const char* name, RenderResult r, const std::string& err);

// NUL-terminated copy; TUIB_ERR_CAPACITY (buffer left empty) when it does not fit.
TuibStatus copy_out(Engine& eng, const char* name, const std::string& s, char* buf, size_t cap, size_t* out_len);
