#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "sink_record.hpp"

namespace profile::sink {

/*
  Bounded blocking queue between savers and the sink worker.

  Enqueue never blocks: a full or shut-down queue rejects the record.
  After Shutdown() Dequeue drains what is left, then returns nullopt.
*/
class SinkQueue {
 public:
  explicit SinkQueue(std::size_t capacity = 1024);

  bool Enqueue(SinkRecord record);

  std::optional<SinkRecord> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  std::size_t             capacity_;
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<SinkRecord>  queue_;
  bool                    shutdown_ = false;
};

} // namespace profile::sink
