#include "core/stability_tracker.h"

#include <sys/stat.h>

#include <algorithm>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

#include "core/ingest_error.h"

namespace dropin {

namespace {

struct Sample {
  int64_t size = 0;
  absl::Time mtime;
};

absl::StatusOr<Sample> TakeSample(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return IngestError(IngestErrorKind::kNotFound, absl::StrCat("File vanished while settling: ", path));
  }
  if (!S_ISREG(st.st_mode)) {
    return IngestError(IngestErrorKind::kNotAFile, absl::StrCat("Not a regular file: ", path));
  }
  return Sample{static_cast<int64_t>(st.st_size), absl::TimeFromTimespec(st.st_mtim)};
}

}  // namespace

StabilityTracker::StabilityTracker(StabilityOptions options) : options_(options) {
  if (options_.backoff < 1.0) options_.backoff = 1.0;
  if (options_.max_retries < 0) options_.max_retries = 0;
  if (options_.max_delay < options_.settle_delay) options_.max_delay = options_.settle_delay;
}

absl::StatusOr<StableFile> StabilityTracker::AwaitStable(std::string_view path, int64_t initial_size,
                                                         std::shared_ptr<CancellationRequest> cancellation) const {
  std::string p(path);
  auto first = TakeSample(p);
  if (!first.ok()) return first.status();
  Sample previous = *first;
  if (initial_size >= 0) previous.size = initial_size;

  absl::Duration delay = options_.settle_delay;
  int samples = 1;
  for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
    if (SleepUnlessCancelled(delay, cancellation.get())) {
      return absl::CancelledError(absl::StrCat("Stability check cancelled: ", path));
    }
    auto current = TakeSample(p);
    if (!current.ok()) return current.status();
    samples++;

    if (current->size == previous.size && current->mtime == previous.mtime) {
      VLOG(1) << path << " stable at " << current->size << " bytes after " << samples << " samples";
      return StableFile{p, current->size, current->mtime, samples};
    }

    VLOG(1) << path << " still changing (" << previous.size << " -> " << current->size << " bytes)";
    previous = *current;
    delay = std::min(delay * options_.backoff, options_.max_delay);
  }

  LOG(WARNING) << "Giving up on " << path << " after " << samples << " samples; still being written";
  return IngestError(IngestErrorKind::kStabilityTimeout,
                     absl::StrCat("File did not stop changing: ", path));
}

}  // namespace dropin
