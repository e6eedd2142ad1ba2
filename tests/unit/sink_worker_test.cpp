#include "internal/sink/sink_worker.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace {

using profile::sink::SaveSink;
using profile::sink::SinkDispatcher;
using profile::sink::SinkQueue;
using profile::sink::SinkRecord;

class RecordingSink final : public SaveSink {
 public:
  void Forward(const SinkRecord& record) override {
    std::lock_guard lock(mutex_);
    if (record.owner_id == "poison") {
      throw std::runtime_error("sink rejected record");
    }
    versions_.push_back(record.version);
  }

  std::vector<std::int64_t> Versions() const {
    std::lock_guard lock(mutex_);
    return versions_;
  }

 private:
  mutable std::mutex        mutex_;
  std::vector<std::int64_t> versions_;
};

SinkRecord Record(const std::string& owner, std::int64_t version) {
  return SinkRecord{"profiles/1", owner, version, "{}"};
}

void TestQueueRejectsWhenFull() {
  SinkQueue queue(2);
  assert(queue.Enqueue(Record("a", 1)));
  assert(queue.Enqueue(Record("a", 2)));
  assert(!queue.Enqueue(Record("a", 3)));
  assert(queue.Size() == 2);
}

void TestQueueDrainsAfterShutdown() {
  SinkQueue queue(4);
  assert(queue.Enqueue(Record("a", 1)));
  assert(queue.Enqueue(Record("a", 2)));
  queue.Shutdown();

  assert(!queue.Enqueue(Record("a", 3)));
  assert(queue.Dequeue()->version == 1);
  assert(queue.Dequeue()->version == 2);
  assert(!queue.Dequeue());
}

void TestDispatcherForwardsInOrder() {
  auto sink = std::make_shared<RecordingSink>();
  {
    SinkDispatcher dispatcher(sink, 16);
    for (std::int64_t v = 1; v <= 5; ++v) {
      assert(dispatcher.Submit(Record("a", v)));
    }
    dispatcher.Stop();
  }
  assert((sink->Versions() == std::vector<std::int64_t>{1, 2, 3, 4, 5}));
}

void TestForwardFailureIsDropped() {
  auto           sink = std::make_shared<RecordingSink>();
  SinkDispatcher dispatcher(sink, 16);
  assert(dispatcher.Submit(Record("a", 1)));
  assert(dispatcher.Submit(Record("poison", 2)));
  assert(dispatcher.Submit(Record("a", 3)));
  dispatcher.Stop();

  assert((sink->Versions() == std::vector<std::int64_t>{1, 3}));
}

void TestSubmitAfterStopIsRejected() {
  auto           sink = std::make_shared<RecordingSink>();
  SinkDispatcher dispatcher(sink, 16);
  dispatcher.Stop();
  assert(!dispatcher.Submit(Record("a", 1)));
}

} // namespace

int main() {
  TestQueueRejectsWhenFull();
  TestQueueDrainsAfterShutdown();
  TestDispatcherForwardsInOrder();
  TestForwardFailureIsDropped();
  TestSubmitAfterStopIsRejected();

  std::cout << "profile_store_unit_sink_worker: pass\n";
  return 0;
}
