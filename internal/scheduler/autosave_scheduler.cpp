#include "autosave_scheduler.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace profile::scheduler {

AutosaveScheduler::AutosaveScheduler(std::chrono::milliseconds tick) : tick_(tick.count() > 0 ? tick : std::chrono::seconds(1)) {
}

AutosaveScheduler::~AutosaveScheduler() {
  Stop();
}

void AutosaveScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_   = std::thread(&AutosaveScheduler::Loop, this);
}

void AutosaveScheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  wake_cv_.notify_all();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

TaskHandle AutosaveScheduler::Register(Task task) {
  std::lock_guard lock(mutex_);
  const auto      handle = next_handle_++;
  tasks_.emplace(handle, std::make_shared<Task>(std::move(task)));
  return handle;
}

void AutosaveScheduler::Cancel(TaskHandle handle) {
  std::unique_lock lock(mutex_);
  tasks_.erase(handle);
  if (running_thread_ == std::this_thread::get_id()) return;
  idle_cv_.wait(lock, [&] { return running_ != handle; });
}

void AutosaveScheduler::RunOnce(util::TimePoint now) {
  // one pass at a time, whichever thread drives it
  std::lock_guard run_lock(run_mutex_);

  std::vector<TaskHandle> handles;
  {
    std::lock_guard lock(mutex_);
    handles.reserve(tasks_.size());
    for (const auto& [handle, task] : tasks_) {
      handles.push_back(handle);
    }
  }

  for (const auto handle : handles) {
    std::shared_ptr<Task> task;
    {
      std::lock_guard lock(mutex_);
      auto            it = tasks_.find(handle);
      if (it == tasks_.end()) continue;
      task            = it->second;
      running_        = handle;
      running_thread_ = std::this_thread::get_id();
    }

    try {
      (*task)(now);
    } catch (const std::exception& e) {
      PROFILE_LOG_ERROR("autosave task failed", {observability::IntField("task", static_cast<std::int64_t>(handle)),
                                                 observability::StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      running_        = 0;
      running_thread_ = std::thread::id();
    }
    idle_cv_.notify_all();
  }
}

void AutosaveScheduler::Loop() {
  while (true) {
    {
      std::unique_lock lock(mutex_);
      wake_cv_.wait_for(lock, tick_, [&] { return stopping_; });
      if (stopping_) return;
    }
    RunOnce(util::Now());
  }
}

std::size_t AutosaveScheduler::TaskCount() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

} // namespace profile::scheduler
