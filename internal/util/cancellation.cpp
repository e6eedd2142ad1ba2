#include "cancellation.hpp"

#include <thread>

namespace profile::util {

bool CancellationToken::IsCancelled() const {
  if (!state_) return false;
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  if (!state_) {
    // a default token can never be cancelled
    std::this_thread::sleep_for(duration);
    return true;
  }

  std::unique_lock lock(state_->mutex);
  state_->cv.wait_for(lock, duration, [this] { return state_->cancelled; });
  return !state_->cancelled;
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {
}

void CancellationSource::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationSource::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
  return CancellationToken(state_);
}

} // namespace profile::util
