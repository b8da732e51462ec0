#ifndef DROPIN_CANCELLATION_H_
#define DROPIN_CANCELLATION_H_

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace dropin {

/**
 * @brief One-shot cancellation flag shared between a task and its owner.
 *
 * Detection sessions, the poll loop and stability re-checks each hold one so
 * that shutdown and session expiry can interrupt their sleeps.
 */
class CancellationRequest {
 public:
  CancellationRequest() = default;

  // Trigger cancellation and wake all waiters.
  void Cancel();

  // Returns true if cancellation has been requested.
  bool IsCancelled() const;

  // Sleeps for up to `timeout`. Returns true as soon as cancellation is
  // requested, false if the full timeout elapsed.
  bool WaitForCancellation(absl::Duration timeout) const;

 private:
  mutable absl::Mutex mu_;
  bool cancelled_ ABSL_GUARDED_BY(mu_) = false;
};

// Sleeps for `timeout`, or until `cancellation` fires when one is given.
// Returns true if the sleep was cut short by cancellation.
bool SleepUnlessCancelled(absl::Duration timeout, const CancellationRequest* cancellation);

}  // namespace dropin

#endif  // DROPIN_CANCELLATION_H_
