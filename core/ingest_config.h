#ifndef DROPIN_INGEST_CONFIG_H_
#define DROPIN_INGEST_CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"

#include "core/constants.h"
#include "core/stability_tracker.h"

namespace dropin {

// Construction-time settings for the whole pipeline.
struct IngestConfig {
  // Registry quotas.
  int max_attachments = kDefaultMaxAttachments;
  int64_t max_total_size_bytes = kDefaultMaxTotalSizeBytes;

  // Per-kind read ceilings.
  int64_t max_file_size_bytes = kDefaultMaxFileSizeBytes;
  int64_t max_image_size_bytes = kDefaultMaxImageSizeBytes;
  int64_t max_drag_file_size_bytes = kDefaultMaxDragFileSizeBytes;

  // Empty means DefaultScratchDirectory().
  std::string scratch_directory;

  absl::Duration detection_window = absl::Milliseconds(kDefaultDetectionWindowMs);
  absl::Duration session_timeout = absl::Milliseconds(kDefaultSessionTimeoutMs);
  absl::Duration poll_interval = absl::Milliseconds(kDefaultPollIntervalMs);

  // Empty means DefaultWatchDirectories().
  std::vector<std::string> watch_directories;
  bool enable_polling = true;

  bool enable_stability_check = true;
  StabilityOptions stability;
  absl::Duration explicit_settle_delay = absl::Milliseconds(kDefaultExplicitSettleDelayMs);

  int worker_threads = 2;
};

// $TMPDIR if set, otherwise the platform temp directory.
std::string SystemTempDirectory();

// <tmp>/dropin-attachments
std::string DefaultScratchDirectory();

// Rejects non-positive quotas and ceilings, and a poll interval above one second.
absl::Status ValidateConfig(const IngestConfig& config);

}  // namespace dropin

#endif  // DROPIN_INGEST_CONFIG_H_
