#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace profile::util {

/*
  Cancellation tied to an owner's lifetime.

  The source is held by whoever controls the owner (attach/detach); tokens are
  handed to long-running waits such as the session-lock poll loop and store
  retries. Cancel() wakes every pending WaitFor() immediately.
*/

class CancellationToken {
 public:
  CancellationToken() = default;

  bool IsCancelled() const;

  // Sleeps up to `duration`. Returns false if cancelled before or during the wait.
  bool WaitFor(std::chrono::milliseconds duration) const;

 private:
  friend class CancellationSource;

  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {
  }

  std::shared_ptr<State> state_;
};

class CancellationSource {
 public:
  CancellationSource();

  void Cancel();
  bool IsCancelled() const;

  CancellationToken Token() const;

 private:
  std::shared_ptr<CancellationToken::State> state_;
};

} // namespace profile::util
