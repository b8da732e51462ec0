#ifndef DROPIN_ATTACHMENT_REGISTRY_H_
#define DROPIN_ATTACHMENT_REGISTRY_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include "core/attachment_types.h"
#include "core/constants.h"
#include "core/ingest_observer.h"
#include "core/scratch_directory.h"

namespace dropin {

struct RegistryLimits {
  int max_attachments = kDefaultMaxAttachments;
  int64_t max_total_size_bytes = kDefaultMaxTotalSizeBytes;
};

// Everything an Attachment has except its id.
struct PendingAttachment {
  std::string filename;
  std::string mime_type;
  int64_t size_bytes = 0;
  AttachmentKind kind = AttachmentKind::kFile;
  AttachmentSource source;
  std::string bytes;
  std::optional<std::string> temp_path;
};

/**
 * @brief The single owner of confirmed attachments.
 *
 * Enforces, atomically with respect to concurrent Add() calls, that the count
 * never exceeds `max_attachments` and the summed size never exceeds
 * `max_total_size_bytes`. Owns the scratch directory and therefore the
 * lifetime of every temp file an attachment refers to.
 */
class AttachmentRegistry {
 public:
  static absl::StatusOr<std::unique_ptr<AttachmentRegistry>> Create(RegistryLimits limits,
                                                                    std::string scratch_root,
                                                                    IngestObserver* observer = nullptr);

  ~AttachmentRegistry();

  AttachmentRegistry(const AttachmentRegistry&) = delete;
  AttachmentRegistry& operator=(const AttachmentRegistry&) = delete;

  // QuotaExceeded leaves the registry untouched; so does AlreadyRegistered
  // for a temp path some attachment already owns. On failure the caller keeps
  // ownership of `pending.temp_path`.
  absl::StatusOr<Attachment> Add(PendingAttachment pending);

  // Unlinks the temp file (failures are logged) and drops the entry.
  absl::Status Remove(std::string_view id);

  // Removes every attachment. Returns how many there were.
  int Clear();

  std::vector<Attachment> List() const;
  std::optional<Attachment> Get(std::string_view id) const;
  AttachmentStats Stats() const;

  // True if an attachment was created from `original_path` (resolved form).
  bool ContainsOriginalPath(std::string_view original_path) const;

  // Whether one more attachment of `size_bytes` would fit right now.
  absl::Status CanAdd(int64_t size_bytes) const;

  // Clear() followed by a sweep of the scratch directory.
  void Shutdown();

  ScratchDirectory& scratch() { return scratch_; }

 private:
  AttachmentRegistry(RegistryLimits limits, std::string scratch_root, IngestObserver* observer);

  absl::Status CheckQuota(int64_t size_bytes) const ABSL_SHARED_LOCKS_REQUIRED(mu_);
  void ReleaseTempFile(const Attachment& attachment);

  const RegistryLimits limits_;
  ScratchDirectory scratch_;
  IngestObserver* const observer_;

  mutable absl::Mutex mu_;
  std::vector<Attachment> entries_ ABSL_GUARDED_BY(mu_);
  int64_t total_size_ ABSL_GUARDED_BY(mu_) = 0;
  int64_t next_id_ ABSL_GUARDED_BY(mu_) = 0;
  absl::flat_hash_set<std::string> temp_paths_ ABSL_GUARDED_BY(mu_);
};

}  // namespace dropin

#endif  // DROPIN_ATTACHMENT_REGISTRY_H_
