#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace docflow::runtime {

/*
  Cooperative cancellation flag shared by an orchestrator run and the stage
  calls it makes. Backoff sleeps go through WaitFor() so cancelling wakes
  them immediately.

  A token may have a parent (the run that made one stage attempt); it then
  counts as cancelled once either is. WaitFor() only wakes early for its own
  Cancel().

  Publication fence:

      attempt thread                       orchestrator
      ──────────────                       ────────────
      PublishUnlessCancelled(commit) ─┐
                                      ├─ mutually exclusive
      Cancel() (timeout / stop)  ─────┘

  After Cancel() returns nothing more is published through the token, and a
  commit that got in first is visible through Published().
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<const CancellationToken> parent);

  void Cancel();

  bool IsCancelled() const;

  // Sleeps up to `duration`. Returns true if the token is (or becomes) cancelled.
  bool WaitFor(std::chrono::milliseconds duration) const;

  // Runs `commit` unless cancelled. False when it was skipped.
  bool PublishUnlessCancelled(const std::function<void()>& commit) const;

  bool Published() const;

 private:
  bool CancelledLocked() const;

  std::shared_ptr<const CancellationToken> parent_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
  mutable bool                    published_ = false;
};

} // namespace docflow::runtime
