#include "core/ingestion_coordinator.h"

#include <filesystem>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "core/directory_poller.h"
#include "core/file_content_reader.h"
#include "core/ingest_error.h"
#include "core/mime_types.h"
#include "core/status_macros.h"

namespace dropin {

namespace fs = std::filesystem;

namespace {

// Typed and pasted paths settle on the shorter explicit delay.
StabilityOptions ExplicitStabilityOptions(const IngestConfig& config) {
  StabilityOptions options = config.stability;
  options.settle_delay = config.explicit_settle_delay;
  return options;
}

}  // namespace

absl::StatusOr<std::unique_ptr<IngestionCoordinator>> IngestionCoordinator::Create(
    IngestConfig config, IngestObserver* observer, std::unique_ptr<ClipboardProvider> clipboard) {
  RETURN_IF_ERROR(ValidateConfig(config));
  if (config.scratch_directory.empty()) config.scratch_directory = DefaultScratchDirectory();
  if (config.watch_directories.empty()) config.watch_directories = DefaultWatchDirectories();

  RegistryLimits limits{config.max_attachments, config.max_total_size_bytes};
  ASSIGN_OR_RETURN(auto registry, AttachmentRegistry::Create(limits, config.scratch_directory, observer));
  if (clipboard == nullptr) clipboard = std::make_unique<SystemClipboardProvider>();

  return std::unique_ptr<IngestionCoordinator>(
      new IngestionCoordinator(std::move(config), observer, std::move(registry), std::move(clipboard)));
}

IngestionCoordinator::IngestionCoordinator(IngestConfig config, IngestObserver* observer,
                                           std::unique_ptr<AttachmentRegistry> registry,
                                           std::unique_ptr<ClipboardProvider> clipboard)
    : config_(std::move(config)),
      observer_(observer),
      registry_(std::move(registry)),
      clipboard_(std::move(clipboard), &registry_->scratch()),
      drag_stability_(config_.stability),
      explicit_stability_(ExplicitStabilityOptions(config_)),
      runner_(std::make_unique<TaskRunner>(config_.worker_threads)) {
  DragEngineOptions options;
  options.watch_directories = config_.watch_directories;
  options.poll_interval = config_.poll_interval;
  options.detection_window = config_.detection_window;
  options.session_timeout = config_.session_timeout;
  options.enable_polling = config_.enable_polling;
  engine_ = std::make_unique<DragDetectionEngine>(
      std::move(options), &registry_->scratch(), observer_,
      [this](const DetectionSession& session, std::vector<DragCandidate> candidates,
             std::shared_ptr<CancellationRequest> cancellation) {
        OnDetected(session, std::move(candidates), std::move(cancellation));
      });
}

IngestionCoordinator::~IngestionCoordinator() { Shutdown(); }

bool IngestionCoordinator::IsShutDown() const {
  absl::ReaderMutexLock lock(&mu_);
  return shut_down_;
}

void IngestionCoordinator::DiscardScratchFile(const std::string& path) {
  absl::Status s = registry_->scratch().Remove(path);
  if (!s.ok()) LOG(WARNING) << "Could not discard " << path << ": " << s;
}

absl::StatusOr<Attachment> IngestionCoordinator::SubmitFilePath(std::string_view path) {
  Candidate candidate;
  candidate.path = std::string(path);
  candidate.origin = Origin::kFileReference;
  return Submit(candidate);
}

absl::StatusOr<Attachment> IngestionCoordinator::Submit(const Candidate& candidate,
                                                        std::shared_ptr<CancellationRequest> cancellation) {
  const std::string resolved = ResolvePath(candidate.path);
  // Scratch files handed over by a detector have no outside identity to dedupe on.
  const bool tracked = !candidate.scratch_owned;
  {
    absl::MutexLock lock(&mu_);
    const absl::Time now = absl::Now();
    absl::erase_if(recent_, [&](const auto& entry) { return now - entry.second >= config_.detection_window; });

    absl::Status rejection;
    if (shut_down_) {
      rejection = absl::CancelledError("Ingestion is shutting down");
    } else if (tracked && processing_.contains(resolved)) {
      rejection = IngestError(IngestErrorKind::kAlreadyRegistered, absl::StrCat("Already processing ", resolved));
    } else if (tracked && registry_->ContainsOriginalPath(resolved)) {
      rejection = IngestError(IngestErrorKind::kAlreadyRegistered, absl::StrCat("Already attached: ", resolved));
    } else if (tracked && candidate.origin == Origin::kDrag) {
      auto it = recent_.find(resolved);
      if (it != recent_.end()) {
        rejection =
            IngestError(IngestErrorKind::kAlreadyRegistered, absl::StrCat("Dropped again too soon: ", resolved));
      }
    }
    if (!rejection.ok()) {
      if (candidate.scratch_owned) DiscardScratchFile(resolved);
      return rejection;
    }
    if (tracked) processing_.insert(resolved);
  }

  absl::StatusOr<Attachment> result = Ingest(candidate, resolved, cancellation);

  {
    absl::MutexLock lock(&mu_);
    if (tracked) processing_.erase(resolved);
    if (result.ok() && tracked && candidate.origin == Origin::kDrag) recent_[resolved] = absl::Now();
  }
  if (!result.ok()) {
    if (candidate.scratch_owned) DiscardScratchFile(resolved);
    LOG(INFO) << "Rejected " << candidate.path << " (" << OriginName(candidate.origin) << "): " << result.status();
  }
  return result;
}

absl::StatusOr<Attachment> IngestionCoordinator::Ingest(const Candidate& candidate, const std::string& resolved,
                                                        const std::shared_ptr<CancellationRequest>& cancellation) {
  const bool is_drag = candidate.origin == Origin::kDrag;
  if (config_.enable_stability_check && !candidate.scratch_owned) {
    const StabilityTracker& tracker = is_drag ? drag_stability_ : explicit_stability_;
    ASSIGN_OR_RETURN(StableFile stable, tracker.AwaitStable(resolved, candidate.observed_size, cancellation));
    VLOG(1) << "Settled " << stable.path << " at " << stable.size_bytes << " bytes";
  }
  if (cancellation != nullptr && cancellation->IsCancelled()) {
    return absl::CancelledError(absl::StrCat("Cancelled before reading ", resolved));
  }

  ReadLimits limits{config_.max_file_size_bytes, config_.max_image_size_bytes};
  if (is_drag) limits = ReadLimits{config_.max_drag_file_size_bytes, config_.max_drag_file_size_bytes};
  ASSIGN_OR_RETURN(FileContent content, ReadFileContent(resolved, limits));
  RETURN_IF_ERROR(registry_->CanAdd(content.size_bytes));

  PendingAttachment pending;
  pending.filename = candidate.display_name.empty() ? content.filename : candidate.display_name;
  pending.mime_type = content.mime_type;
  pending.size_bytes = content.size_bytes;
  pending.kind = content.kind;
  pending.source.origin = candidate.origin;
  pending.source.observed_at = absl::Now();
  if (!candidate.scratch_owned) pending.source.original_path = resolved;

  // Drag content always ends up as an owned scratch file, never a caller's path.
  bool created_temp = false;
  if (candidate.scratch_owned) {
    pending.temp_path = resolved;
  } else if (is_drag) {
    ASSIGN_OR_RETURN(std::string temp_path, registry_->scratch().Materialize(content.bytes, pending.filename));
    pending.temp_path = temp_path;
    created_temp = true;
  } else {
    pending.bytes = std::move(content.bytes);
  }

  std::string temp_path = pending.temp_path.value_or("");
  absl::StatusOr<Attachment> added = registry_->Add(std::move(pending));
  if (!added.ok() && created_temp) DiscardScratchFile(temp_path);
  return added;
}

absl::StatusOr<Attachment> IngestionCoordinator::RegisterScratchFile(const std::string& temp_path,
                                                                     std::string filename, std::string mime_type,
                                                                     int64_t size_bytes, Origin origin) {
  AttachmentKind kind = IsImageMimeType(mime_type) ? AttachmentKind::kImage : AttachmentKind::kFile;
  int64_t ceiling = kind == AttachmentKind::kImage ? config_.max_image_size_bytes : config_.max_file_size_bytes;
  absl::Status precheck;
  if (IsShutDown()) {
    precheck = absl::CancelledError("Ingestion is shutting down");
  } else if (size_bytes > ceiling) {
    precheck = IngestError(IngestErrorKind::kTooLarge,
                           absl::StrCat(filename, " is ", size_bytes, " bytes, limit is ", ceiling));
  } else if (kind == AttachmentKind::kImage && !IsSupportedImageMimeType(mime_type)) {
    precheck = IngestError(IngestErrorKind::kUnsupportedType, absl::StrCat("Unsupported image format ", mime_type));
  } else {
    precheck = registry_->CanAdd(size_bytes);
  }
  if (!precheck.ok()) {
    DiscardScratchFile(temp_path);
    return precheck;
  }

  PendingAttachment pending;
  pending.filename = std::move(filename);
  pending.mime_type = std::move(mime_type);
  pending.size_bytes = size_bytes;
  pending.kind = kind;
  pending.source.origin = origin;
  pending.source.observed_at = absl::Now();
  pending.temp_path = temp_path;

  absl::StatusOr<Attachment> added = registry_->Add(std::move(pending));
  if (!added.ok()) DiscardScratchFile(temp_path);
  return added;
}

absl::StatusOr<Attachment> IngestionCoordinator::SubmitBuffer(std::string_view bytes, std::string_view filename,
                                                              std::string_view mime_type, Origin origin) {
  if (IsShutDown()) return absl::CancelledError("Ingestion is shutting down");
  std::string mime = mime_type.empty() ? MimeTypeForPath(filename) : std::string(mime_type);
  std::string name = SanitizeFilename(filename);
  ASSIGN_OR_RETURN(std::string temp_path, registry_->scratch().Materialize(bytes, name));
  return RegisterScratchFile(temp_path, std::move(name), std::move(mime), static_cast<int64_t>(bytes.size()), origin);
}

PasteOutcome IngestionCoordinator::Paste() {
  PasteOutcome outcome;
  if (IsShutDown()) {
    outcome.rejections.push_back(absl::CancelledError("Ingestion is shutting down"));
    return outcome;
  }

  ClipboardContent content = clipboard_.Read();
  outcome.type = content.type;
  switch (content.type) {
    case ClipboardContent::Type::kText:
      outcome.text = std::move(content.text);
      break;
    case ClipboardContent::Type::kImage: {
      // Re-validate what actually landed on disk before it counts against the quota.
      auto checked = ReadImageContent(content.temp_path,
                                      ReadLimits{config_.max_file_size_bytes, config_.max_image_size_bytes});
      if (!checked.ok()) {
        DiscardScratchFile(content.temp_path);
        outcome.rejections.push_back(checked.status());
        break;
      }
      auto added = RegisterScratchFile(content.temp_path, content.filename, checked->mime_type, checked->size_bytes,
                                       Origin::kPaste);
      if (added.ok()) {
        outcome.attachments.push_back(*std::move(added));
      } else {
        outcome.rejections.push_back(added.status());
      }
      break;
    }
    case ClipboardContent::Type::kFile:
    case ClipboardContent::Type::kFiles:
      for (const std::string& path : content.paths) {
        Candidate candidate;
        candidate.path = path;
        candidate.origin = Origin::kPaste;
        auto added = Submit(candidate);
        if (added.ok()) {
          outcome.attachments.push_back(*std::move(added));
        } else {
          outcome.rejections.push_back(added.status());
        }
      }
      break;
  }
  LOG(INFO) << "Paste (" << ClipboardContentTypeName(outcome.type) << "): " << outcome.attachments.size()
            << " attached, " << outcome.rejections.size() << " rejected";
  return outcome;
}

std::vector<Attachment> IngestionCoordinator::SubmitFromClipboardCommand() { return Paste().attachments; }

void IngestionCoordinator::SubmitRawTerminalBytes(std::string_view bytes) {
  if (IsShutDown()) return;
  engine_->Feed(bytes);
}

void IngestionCoordinator::FlushTerminalInput() {
  if (IsShutDown()) return;
  engine_->Flush();
}

void IngestionCoordinator::OnDetected(const DetectionSession& session, std::vector<DragCandidate> candidates,
                                      std::shared_ptr<CancellationRequest> cancellation) {
  auto shared = std::make_shared<std::vector<DragCandidate>>(std::move(candidates));
  bool posted = runner_->Post(
      [this, session, shared, cancellation]() { ProcessSession(session, *shared, cancellation); });
  if (!posted) {
    for (const DragCandidate& c : *shared) {
      if (c.scratch_owned) DiscardScratchFile(c.path);
    }
  }
}

void IngestionCoordinator::ProcessSession(const DetectionSession& session,
                                          const std::vector<DragCandidate>& candidates,
                                          const std::shared_ptr<CancellationRequest>& cancellation) {
  std::vector<Attachment> added;
  for (const DragCandidate& c : candidates) {
    if (!engine_->RenewSession(session.session_id, absl::Now())) {
      if (c.scratch_owned) DiscardScratchFile(c.path);
      if (observer_ != nullptr && !IsShutDown()) {
        observer_->OnDragSessionProgress(session, absl::StrCat("Skipped ", c.display_name, ": drop session expired"));
      }
      continue;
    }
    Candidate candidate;
    candidate.path = c.path;
    candidate.origin = Origin::kDrag;
    candidate.display_name = c.display_name;
    candidate.observed_size = c.observed_size;
    candidate.scratch_owned = c.scratch_owned;
    candidate.session_id = session.session_id;

    auto result = Submit(candidate, cancellation);
    if (result.ok()) {
      LOG(INFO) << "Dropped " << FileCategoryName(ClassifyFile(c.display_name)) << " file " << c.display_name
                << " attached as " << result->id;
      added.push_back(*std::move(result));
    } else if (observer_ != nullptr && result.status().code() != absl::StatusCode::kCancelled) {
      observer_->OnDragSessionProgress(session,
                                       absl::StrCat("Skipped ", c.display_name, ": ", result.status().message()));
    }
  }

  DetectionSession done = session;
  if (engine_->FinishSession(session.session_id)) {
    done.status = SessionStatus::kCommitted;
    if (observer_ != nullptr) observer_->OnDragSessionCompleted(done, added);
  } else {
    VLOG(1) << "Session " << session.session_id << " expired before committing";
  }
}

std::vector<Attachment> IngestionCoordinator::ListAttachments() const { return registry_->List(); }

std::optional<Attachment> IngestionCoordinator::GetAttachment(std::string_view id) const { return registry_->Get(id); }

AttachmentStats IngestionCoordinator::Stats() const { return registry_->Stats(); }

absl::Status IngestionCoordinator::RemoveAttachment(std::string_view id) { return registry_->Remove(id); }

int IngestionCoordinator::ClearAttachments() { return registry_->Clear(); }

absl::Status IngestionCoordinator::StartDetection() {
  if (IsShutDown()) return absl::FailedPreconditionError("Ingestion is shut down");
  return engine_->Start();
}

void IngestionCoordinator::ScanWatchDirectories() {
  if (IsShutDown()) return;
  engine_->PollOnce(absl::Now());
}

DragEngineStats IngestionCoordinator::DetectionStats() const { return engine_->GetStats(); }

size_t IngestionCoordinator::RecentDropCount() const {
  absl::ReaderMutexLock lock(&mu_);
  return recent_.size();
}

void IngestionCoordinator::WaitIdle() { runner_->WaitIdle(); }

void IngestionCoordinator::Shutdown() {
  {
    absl::MutexLock lock(&mu_);
    if (shut_down_) return;
    shut_down_ = true;
  }
  LOG(INFO) << "Shutting down ingestion";
  engine_->Stop();
  runner_->Shutdown();
  registry_->Shutdown();
}

}  // namespace dropin
