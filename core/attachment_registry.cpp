#include "core/attachment_registry.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "core/file_content_reader.h"
#include "core/ingest_error.h"

namespace dropin {

namespace {

std::string Megabytes(int64_t bytes) {
  return absl::StrFormat("%.1fMB", static_cast<double>(bytes) / static_cast<double>(kMiB));
}

}  // namespace

absl::StatusOr<std::unique_ptr<AttachmentRegistry>> AttachmentRegistry::Create(RegistryLimits limits,
                                                                               std::string scratch_root,
                                                                               IngestObserver* observer) {
  if (limits.max_attachments <= 0) {
    return absl::InvalidArgumentError("max_attachments must be positive");
  }
  if (limits.max_total_size_bytes <= 0) {
    return absl::InvalidArgumentError("max_total_size_bytes must be positive");
  }
  if (scratch_root.empty()) {
    return absl::InvalidArgumentError("scratch_root must not be empty");
  }
  return std::unique_ptr<AttachmentRegistry>(new AttachmentRegistry(limits, std::move(scratch_root), observer));
}

AttachmentRegistry::AttachmentRegistry(RegistryLimits limits, std::string scratch_root, IngestObserver* observer)
    : limits_(limits), scratch_(std::move(scratch_root)), observer_(observer) {}

AttachmentRegistry::~AttachmentRegistry() = default;

absl::Status AttachmentRegistry::CheckQuota(int64_t size_bytes) const {
  if (static_cast<int>(entries_.size()) >= limits_.max_attachments) {
    return IngestError(IngestErrorKind::kQuotaExceeded,
                       absl::StrCat("Attachment limit reached (", limits_.max_attachments, ")"));
  }
  if (total_size_ + size_bytes > limits_.max_total_size_bytes) {
    return IngestError(IngestErrorKind::kQuotaExceeded,
                       absl::StrCat("Total attachment size would be ", Megabytes(total_size_ + size_bytes),
                                    ", limit is ", Megabytes(limits_.max_total_size_bytes)));
  }
  return absl::OkStatus();
}

absl::Status AttachmentRegistry::CanAdd(int64_t size_bytes) const {
  absl::ReaderMutexLock lock(&mu_);
  return CheckQuota(size_bytes);
}

absl::StatusOr<Attachment> AttachmentRegistry::Add(PendingAttachment pending) {
  Attachment attachment;
  {
    absl::MutexLock lock(&mu_);
    if (absl::Status quota = CheckQuota(pending.size_bytes); !quota.ok()) {
      LOG(INFO) << "Rejected " << pending.filename << ": " << quota.message();
      return quota;
    }
    if (pending.temp_path && temp_paths_.contains(*pending.temp_path)) {
      return IngestError(IngestErrorKind::kAlreadyRegistered,
                         absl::StrCat("Temp file already owned by another attachment: ", *pending.temp_path));
    }

    attachment.id = absl::StrCat(kAttachmentIdPrefix, ++next_id_);
    attachment.filename = std::move(pending.filename);
    attachment.mime_type = std::move(pending.mime_type);
    attachment.size_bytes = pending.size_bytes;
    attachment.kind = pending.kind;
    attachment.source = std::move(pending.source);
    attachment.temp_path = std::move(pending.temp_path);
    // Content lives in exactly one place.
    if (!attachment.is_temp_file()) attachment.bytes = std::move(pending.bytes);

    if (attachment.temp_path) temp_paths_.insert(*attachment.temp_path);
    total_size_ += attachment.size_bytes;
    entries_.push_back(attachment);
  }

  LOG(INFO) << "Added " << attachment.id << " (" << attachment.filename << ", " << attachment.size_bytes
            << " bytes, " << OriginName(attachment.source.origin) << ")";
  if (observer_ != nullptr) observer_->OnAttachmentAdded(attachment);
  return attachment;
}

void AttachmentRegistry::ReleaseTempFile(const Attachment& attachment) {
  if (!attachment.temp_path) return;
  absl::Status s = scratch_.Remove(*attachment.temp_path);
  if (!s.ok()) LOG(WARNING) << "Could not remove temp file for " << attachment.id << ": " << s;
}

absl::Status AttachmentRegistry::Remove(std::string_view id) {
  Attachment removed;
  {
    absl::MutexLock lock(&mu_);
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Attachment& a) { return a.id == id; });
    if (it == entries_.end()) {
      return absl::NotFoundError(absl::StrCat("No attachment with id ", id));
    }
    removed = std::move(*it);
    entries_.erase(it);
    total_size_ -= removed.size_bytes;
    if (removed.temp_path) temp_paths_.erase(*removed.temp_path);
  }

  ReleaseTempFile(removed);
  LOG(INFO) << "Removed " << removed.id << " (" << removed.filename << ")";
  if (observer_ != nullptr) observer_->OnAttachmentRemoved(removed);
  return absl::OkStatus();
}

int AttachmentRegistry::Clear() {
  std::vector<Attachment> removed;
  {
    absl::MutexLock lock(&mu_);
    removed.swap(entries_);
    total_size_ = 0;
    temp_paths_.clear();
  }
  for (const Attachment& attachment : removed) {
    ReleaseTempFile(attachment);
    if (observer_ != nullptr) observer_->OnAttachmentRemoved(attachment);
  }
  if (!removed.empty()) LOG(INFO) << "Cleared " << removed.size() << " attachment(s)";
  return static_cast<int>(removed.size());
}

std::vector<Attachment> AttachmentRegistry::List() const {
  absl::ReaderMutexLock lock(&mu_);
  return entries_;
}

std::optional<Attachment> AttachmentRegistry::Get(std::string_view id) const {
  absl::ReaderMutexLock lock(&mu_);
  for (const Attachment& a : entries_) {
    if (a.id == id) return a;
  }
  return std::nullopt;
}

AttachmentStats AttachmentRegistry::Stats() const {
  AttachmentStats stats;
  absl::ReaderMutexLock lock(&mu_);
  stats.count = static_cast<int>(entries_.size());
  stats.total_size = total_size_;
  for (const Attachment& a : entries_) {
    if (a.kind == AttachmentKind::kImage) {
      stats.image_count++;
    } else {
      stats.file_count++;
    }
    if (a.is_temp_file()) stats.temp_file_count++;
  }
  return stats;
}

bool AttachmentRegistry::ContainsOriginalPath(std::string_view original_path) const {
  std::string resolved = ResolvePath(original_path);
  absl::ReaderMutexLock lock(&mu_);
  return std::any_of(entries_.begin(), entries_.end(), [&](const Attachment& a) {
    return a.source.original_path && *a.source.original_path == resolved;
  });
}

void AttachmentRegistry::Shutdown() {
  Clear();
  scratch_.Sweep();
}

}  // namespace dropin
