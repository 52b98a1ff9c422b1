#pragma once
/*
 * EventQueue
 *
 * Purpose: single FIFO shared by real terminal input and injected events.
 * Note: has its own lock so producers never wait on a blocked reader.
 */
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include "event.hpp"

class EventQueue {
public:
  void push(const Event& e);
  // Non-blocking; false when empty.
  bool try_pop(Event& out);
  // Blocks up to `timeout` for an event.
  bool wait_pop(Event& out, std::chrono::milliseconds timeout);
  size_t size() const;
  void clear();

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<Event> q_;
};
