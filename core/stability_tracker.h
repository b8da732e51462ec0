#ifndef DROPIN_STABILITY_TRACKER_H_
#define DROPIN_STABILITY_TRACKER_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "core/cancellation.h"

namespace dropin {

struct StabilityOptions {
  absl::Duration settle_delay = absl::Seconds(1);
  absl::Duration max_delay = absl::Seconds(3);
  double backoff = 1.5;
  int max_retries = 3;
};

struct StableFile {
  std::string path;
  int64_t size_bytes = 0;
  absl::Time modified_at = absl::InfinitePast();
  int samples = 0;
};

/**
 * @brief Decides whether a dropped file has finished being written.
 *
 * A file is stable once two consecutive samples, one settle interval apart,
 * agree on size and modification time. Each disagreement stretches the interval
 * by `backoff` up to `max_delay`; after `max_retries` disagreements the file is
 * given up on with StabilityTimeout.
 */
class StabilityTracker {
 public:
  explicit StabilityTracker(StabilityOptions options = {});

  // `initial_size` is what the detector saw, or -1 to sample it now.
  // Returns NotFound if the file disappears, Cancelled if `cancellation` fires.
  absl::StatusOr<StableFile> AwaitStable(std::string_view path, int64_t initial_size = -1,
                                         std::shared_ptr<CancellationRequest> cancellation = nullptr) const;

  const StabilityOptions& options() const { return options_; }

 private:
  StabilityOptions options_;
};

}  // namespace dropin

#endif  // DROPIN_STABILITY_TRACKER_H_
