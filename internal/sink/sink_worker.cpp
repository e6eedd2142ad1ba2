#include "sink_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace profile::sink {

SinkWorker::SinkWorker(std::shared_ptr<SinkQueue> queue, std::shared_ptr<SaveSink> sink)
    : queue_(std::move(queue)), sink_(std::move(sink)) {
}

SinkWorker::~SinkWorker() {
  Stop();
}

void SinkWorker::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&SinkWorker::Run, this);
}

void SinkWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void SinkWorker::Run() {
  while (auto record = queue_->Dequeue()) {
    try {
      sink_->Forward(*record);
    } catch (const std::exception& e) {
      PROFILE_LOG_WARN("sink forward failed",
                       {observability::StringField("owner_id", record->owner_id), observability::IntField("version", record->version),
                        observability::StringField("error", e.what())});
    }
  }
}

SinkDispatcher::SinkDispatcher(std::shared_ptr<SaveSink> sink, std::size_t capacity)
    : queue_(std::make_shared<SinkQueue>(capacity)), worker_(queue_, std::move(sink)) {
  worker_.Start();
}

SinkDispatcher::~SinkDispatcher() {
  Stop();
}

bool SinkDispatcher::Submit(SinkRecord record) {
  const auto owner_id = record.owner_id;
  const auto version  = record.version;
  if (queue_->Enqueue(std::move(record))) return true;

  PROFILE_LOG_WARN("sink queue full, record dropped",
                   {observability::StringField("owner_id", owner_id), observability::IntField("version", version)});
  return false;
}

void SinkDispatcher::Stop() {
  worker_.Stop();
}

} // namespace profile::sink
