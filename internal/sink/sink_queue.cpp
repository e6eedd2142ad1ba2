#include "sink_queue.hpp"

namespace profile::sink {

SinkQueue::SinkQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool SinkQueue::Enqueue(SinkRecord record) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(record));
  }
  cv_.notify_one();
  return true;
}

std::optional<SinkRecord> SinkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  SinkRecord record = std::move(queue_.front());
  queue_.pop();
  return record;
}

void SinkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t SinkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace profile::sink
