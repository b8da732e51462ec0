#ifndef DROPIN_CONSTANTS_H_
#define DROPIN_CONSTANTS_H_

#include <cstdint>

namespace dropin {

constexpr int64_t kKiB = 1024;
constexpr int64_t kMiB = 1024 * kKiB;

// Registry quotas
constexpr int kDefaultMaxAttachments = 10;
constexpr int64_t kDefaultMaxTotalSizeBytes = 50 * kMiB;

// Per-kind read ceilings
constexpr int64_t kDefaultMaxFileSizeBytes = 10 * kMiB;
constexpr int64_t kDefaultMaxImageSizeBytes = 5 * kMiB;
constexpr int64_t kDefaultMaxDragFileSizeBytes = 50 * kMiB;

// Detection timing
constexpr int kDefaultDetectionWindowMs = 3000;
constexpr int kDefaultSessionTimeoutMs = 8000;
// Settle delay for typed and pasted paths; drops use StabilityOptions::settle_delay.
constexpr int kDefaultExplicitSettleDelayMs = 250;
constexpr int kDefaultPollIntervalMs = 500;

// Directory names under the system temp dir
constexpr char kScratchDirName[] = "dropin-attachments";
constexpr char kDragDropDirName[] = "dropin-drag-drop";

constexpr char kAttachmentIdPrefix[] = "att_";
constexpr char kSessionIdPrefix[] = "session-";

}  // namespace dropin

#endif  // DROPIN_CONSTANTS_H_
