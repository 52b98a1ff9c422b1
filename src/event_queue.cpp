#include "event_queue.hpp"

void EventQueue::push(const Event& e) {
  {
    std::lock_guard<std::mutex> lk(m_);
    q_.push_back(e);
  }
  cv_.notify_one();
}

bool EventQueue::try_pop(Event& out) {
  std::lock_guard<std::mutex> lk(m_);
  if (q_.empty()) return false;
  out = q_.front();
  q_.pop_front();
  return true;
}

bool EventQueue::wait_pop(Event& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(m_);
  if (!cv_.wait_for(lk, timeout, [this] { return !q_.empty(); })) return false;
  out = q_.front();
  q_.pop_front();
  return true;
}

size_t EventQueue::size() const {
  std::lock_guard<std::mutex> lk(m_);
  return q_.size();
}

void EventQueue::clear() {
  std::lock_guard<std::mutex> lk(m_);
  q_.clear();
}
