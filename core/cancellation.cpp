#include "core/cancellation.h"

#include "absl/time/clock.h"

namespace dropin {

void CancellationRequest::Cancel() {
  absl::MutexLock lock(&mu_);
  cancelled_ = true;
}

bool CancellationRequest::IsCancelled() const {
  absl::ReaderMutexLock lock(&mu_);
  return cancelled_;
}

bool CancellationRequest::WaitForCancellation(absl::Duration timeout) const {
  absl::MutexLock lock(&mu_);
  return mu_.AwaitWithTimeout(absl::Condition(&cancelled_), timeout);
}

bool SleepUnlessCancelled(absl::Duration timeout, const CancellationRequest* cancellation) {
  if (cancellation == nullptr) {
    absl::SleepFor(timeout);
    return false;
  }
  return cancellation->WaitForCancellation(timeout);
}

}  // namespace dropin
