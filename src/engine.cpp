#include "engine.hpp"
#include "log.hpp"
#include <algorithm>
#include <chrono>

// upper bound on one device read so injected events are not starved
static constexpr int kPollSliceMs = 10;

Engine::Engine(EngineConfig cfg) {
  std::string err;
  if (!configure(cfg, err)) {
    std::string ignored;
    log_ = make_logger("", false, cfg.trace, ignored);
    log_->warn("{}", err);
  }
}

Engine::~Engine() {
  session_.reset();
  log_->flush();
}

Engine& Engine::instance() {
  static Engine engine;
  return engine;
}

bool Engine::configure(const EngineConfig& cfg, std::string& err) {
  // nothing changes unless the new logger could be built
  std::shared_ptr<spdlog::logger> logger = make_logger(cfg.log_path, cfg.log_append, cfg.trace, err);
  if (!err.empty()) return false;
  cfg_ = cfg;
  log_ = std::move(logger);
  log_->info("engine configured: raw={} alt={} trace={} append={}", cfg.default_raw, cfg.default_alt_screen,
             cfg.trace, cfg.log_append);
  return true;
}

bool Engine::check_size(long width, long height, std::string& err) const {
  if (!caps_.enabled) return true;
  if (width > static_cast<long>(caps_.max_width) || height > static_cast<long>(caps_.max_height) ||
      static_cast<uint64_t>(std::max(0L, width)) * static_cast<uint64_t>(std::max(0L, height)) > caps_.max_area) {
    err = "size " + std::to_string(width) + "x" + std::to_string(height) + " exceeds safety caps";
    return false;
  }
  return true;
}

bool Engine::check_text(size_t len, std::string& err) const {
  if (!caps_.enabled || len <= caps_.max_text_len) return true;
  err = "text of " + std::to_string(len) + " bytes exceeds cap of " + std::to_string(caps_.max_text_len);
  return false;
}

bool Engine::check_batch(size_t n, std::string& err) const {
  if (!caps_.enabled || n <= caps_.max_batch) return true;
  err = "batch of " + std::to_string(n) + " items exceeds cap of " + std::to_string(caps_.max_batch);
  return false;
}

bool Engine::open_session(std::unique_ptr<ITerminal> term, std::string& err) {
  if (session_) { err = "a terminal session is already open"; return false; }
  session_ = std::make_unique<Session>(std::move(term));
  TermSize sz = session_->size();
  log_->info("session opened {}x{} interactive={}", sz.cols, sz.rows, session_->terminal().interactive());
  std::string mode_err;
  if (cfg_.default_raw && !session_->set_raw(true, mode_err)) log_->warn("default raw mode: {}", mode_err);
  if (cfg_.default_alt_screen && !session_->set_alt_screen(true, mode_err)) log_->warn("default alt screen: {}", mode_err);
  return true;
}

void Engine::close_session() {
  if (!session_) return;
  session_.reset();
  log_->info("session closed");
}

void Engine::observe(const Event& e) {
  if (session_) session_->observe(e);
}

bool Engine::next_event(Event& out, int timeout_ms) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(std::max(0, timeout_ms));
  for (;;) {
    if (events_.try_pop(out)) {
      std::lock_guard<std::mutex> lk(mu_);
      observe(out);
      return true;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    const int slice = static_cast<int>(std::clamp<long long>(left, 0, kPollSliceMs));
    const auto slice_start = clock::now();
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (session_) {
        const int wait = session_->terminal().interactive() ? slice : 0;
        if (session_->read_event(out, wait)) return true;
      }
    }
    if (left <= 0) {
      if (!events_.try_pop(out)) return false;
      std::lock_guard<std::mutex> lk(mu_);
      observe(out);
      return true;
    }
    // the device returned early: wait for injected events for the rest of the slice
    const auto rest = std::chrono::milliseconds(slice) -
                      std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - slice_start);
    if (rest.count() > 0 && events_.wait_pop(out, rest)) {
      std::lock_guard<std::mutex> lk(mu_);
      observe(out);
      return true;
    }
  }
}
