#pragma once

#include <memory>
#include <thread>

#include "save_sink.hpp"
#include "sink_queue.hpp"

namespace profile::sink {

/*
  Background worker forwarding queued records to a SaveSink.
  Delivery failures are logged and the record is dropped.
*/
class SinkWorker {
 public:
  SinkWorker(std::shared_ptr<SinkQueue> queue, std::shared_ptr<SaveSink> sink);
  ~SinkWorker();

  SinkWorker(const SinkWorker&)            = delete;
  SinkWorker& operator=(const SinkWorker&) = delete;

  void Start();

  // Drains the queue, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<SinkQueue> queue_;
  std::shared_ptr<SaveSink>  sink_;
  std::thread                thread_;
};

/*
  SinkDispatcher

  What a profile holds: Submit() only enqueues, the owned worker delivers.
*/
class SinkDispatcher {
 public:
  SinkDispatcher(std::shared_ptr<SaveSink> sink, std::size_t capacity);
  ~SinkDispatcher();

  SinkDispatcher(const SinkDispatcher&)            = delete;
  SinkDispatcher& operator=(const SinkDispatcher&) = delete;

  // Returns false when the record was dropped.
  bool Submit(SinkRecord record);

  void Stop();

 private:
  std::shared_ptr<SinkQueue> queue_;
  SinkWorker                 worker_;
};

} // namespace profile::sink
