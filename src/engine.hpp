#pragma once
/*
 * Engine
 *
 * Purpose: the one explicit context behind the C interface: registry,
 *          renderer, event queue, session, caps, last error and logger.
 * Locking: every C entry point holds mutex() for its whole body, except the
 *          event wait which only takes it around device reads.
 */
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include "cell_buffer.hpp"
#include "config.hpp"
#include "event_queue.hpp"
#include "registry.hpp"
#include "renderer.hpp"
#include "session.hpp"

struct EngineConfig {
  bool default_raw = true;
  bool default_alt_screen = false;
  bool trace = false;
  std::string log_path;
  bool log_append = false;
};

struct SafetyCaps {
  bool enabled = false;
  uint32_t max_width = TUIB_DEFAULT_MAX_WIDTH;
  uint32_t max_height = TUIB_DEFAULT_MAX_HEIGHT;
  uint64_t max_area = TUIB_DEFAULT_MAX_AREA;
  size_t max_text_len = TUIB_DEFAULT_MAX_TEXT_LEN;
  size_t max_batch = TUIB_DEFAULT_MAX_BATCH;
};

class Engine {
public:
  explicit Engine(EngineConfig cfg = {});
  ~Engine();
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  static Engine& instance();

  std::mutex& mutex() { return mu_; }

  // Returns false (with `err`) only when the log file could not be opened; the old settings stay.
  bool configure(const EngineConfig& cfg, std::string& err);
  const EngineConfig& config() const { return cfg_; }
  spdlog::logger& log() { return *log_; }

  Registry& registry() { return registry_; }
  const Renderer& renderer() const { return renderer_; }
  EventQueue& events() { return events_; }
  CellBuffer& headless_frame() { return headless_; }

  SafetyCaps& caps() { return caps_; }
  bool check_size(long width, long height, std::string& err) const;
  bool check_text(size_t len, std::string& err) const;
  bool check_batch(size_t n, std::string& err) const;

  // Applies the configured default modes; failures to switch are logged, not fatal.
  bool open_session(std::unique_ptr<ITerminal> term, std::string& err);
  void close_session();
  Session* session() { return session_.get(); }

  // Queue first, then device input; call without holding mutex().
  bool next_event(Event& out, int timeout_ms);

  void set_last_error(std::string msg) { last_error_ = std::move(msg); }
  const std::string& last_error() const { return last_error_; }
  void clear_last_error() { last_error_.clear(); }

private:
  void observe(const Event& e);

  std::mutex mu_;
  EngineConfig cfg_;
  std::shared_ptr<spdlog::logger> log_;
  Registry registry_;
  Renderer renderer_;
  EventQueue events_;
  CellBuffer headless_;
  SafetyCaps caps_;
  std::unique_ptr<Session> session_;
  std::string last_error_;
};
