// src/capture/queue.cpp

#include "capture/queue.hpp"

#include <utility>

namespace capture {

void IngestionQueue::push(QueueItem item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.push_back(std::move(item));
  }
  ready_.notify_one();
}

std::deque<QueueItem> IngestionQueue::drain() {
  std::deque<QueueItem> out;
  std::lock_guard<std::mutex> lock(mutex_);
  out.swap(items_);
  return out;
}

std::size_t IngestionQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t dropped = items_.size();
  items_.clear();
  return dropped;
}

bool IngestionQueue::wait_for(std::chrono::nanoseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, timeout, [this] { return woken_ || !items_.empty(); });
  woken_ = false;
  return !items_.empty();
}

void IngestionQueue::wake() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    woken_ = true;
  }
  ready_.notify_all();
}

std::size_t IngestionQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return items_.size();
}

} // namespace capture
