#include "cancellation.hpp"

namespace docflow::runtime {

CancellationToken::CancellationToken(std::shared_ptr<const CancellationToken> parent) : parent_(std::move(parent)) {
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::CancelledLocked() const {
  return cancelled_ || (parent_ && parent_->IsCancelled());
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return CancelledLocked();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, duration, [&] { return cancelled_; });
  return CancelledLocked();
}

bool CancellationToken::PublishUnlessCancelled(const std::function<void()>& commit) const {
  std::lock_guard lock(mutex_);
  if (CancelledLocked()) {
    return false;
  }
  commit();
  published_ = true;
  return true;
}

bool CancellationToken::Published() const {
  std::lock_guard lock(mutex_);
  return published_;
}

} // namespace docflow::runtime
