#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace profile::scheduler {

using TaskHandle = std::uint64_t;

/*
  AutosaveScheduler

  One background thread shared by every profile of a manager. Each tick it
  calls every registered task with the current time; the task decides
  whether a save is due. Tasks run on the scheduler thread, one at a time.
*/
class AutosaveScheduler {
 public:
  using Task = std::function<void(util::TimePoint now)>;

  explicit AutosaveScheduler(std::chrono::milliseconds tick = std::chrono::seconds(1));
  ~AutosaveScheduler();

  AutosaveScheduler(const AutosaveScheduler&)            = delete;
  AutosaveScheduler& operator=(const AutosaveScheduler&) = delete;

  void Start();
  void Stop();

  TaskHandle Register(Task task);

  // Removes the task and waits for a run of it already in progress. Called
  // from inside the task itself it only removes.
  void Cancel(TaskHandle handle);

  // Runs every task once on the calling thread.
  void RunOnce(util::TimePoint now);

  std::size_t TaskCount() const;

 private:
  void Loop();

  std::chrono::milliseconds tick_;

  mutable std::mutex                          mutex_;
  std::condition_variable                     wake_cv_;
  std::condition_variable                     idle_cv_;
  std::map<TaskHandle, std::shared_ptr<Task>> tasks_;
  TaskHandle                                  next_handle_{1};
  TaskHandle                                  running_{0};
  std::thread::id                             running_thread_;
  bool                                        stopping_{false};

  std::mutex  run_mutex_;
  std::thread thread_;
};

} // namespace profile::scheduler
