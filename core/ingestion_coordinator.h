#ifndef DROPIN_INGESTION_COORDINATOR_H_
#define DROPIN_INGESTION_COORDINATOR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "core/attachment_registry.h"
#include "core/attachment_types.h"
#include "core/cancellation.h"
#include "core/clipboard_source.h"
#include "core/drag_detection_engine.h"
#include "core/ingest_config.h"
#include "core/ingest_observer.h"
#include "core/stability_tracker.h"
#include "core/task_runner.h"

namespace dropin {

// A path proposed by any source.
struct Candidate {
  std::string path;
  Origin origin = Origin::kFileReference;
  // Defaults to the file's basename.
  std::string display_name;
  int64_t observed_size = -1;
  // `path` is a scratch file already owned by the pipeline.
  bool scratch_owned = false;
  std::string session_id;
};

struct PasteOutcome {
  ClipboardContent::Type type = ClipboardContent::Type::kText;
  std::vector<Attachment> attachments;
  std::vector<absl::Status> rejections;
  // The clipboard text when nothing file-like was found.
  std::string text;
};

/**
 * @brief Entry point of the pipeline.
 *
 * Every source funnels through here: typed paths, clipboard reads, raw terminal
 * bytes and directory polls. A path is rejected with AlreadyRegistered while it
 * is being processed or is already attached, and a drag-origin path also once it
 * was ingested within the current detection window. Accepted paths are settled
 * (drag paths with the full stability delay, typed and pasted paths with the
 * shorter explicit one), read under the per-origin ceiling, checked against the
 * quota and committed to the registry. Any failure leaves no partial state behind.
 *
 * Detector candidates are processed on a worker pool so the input loop never
 * waits on stability checks. Each candidate of a session gets its own
 * session_timeout budget.
 */
class IngestionCoordinator {
 public:
  // `clipboard` defaults to SystemClipboardProvider.
  static absl::StatusOr<std::unique_ptr<IngestionCoordinator>> Create(
      IngestConfig config, IngestObserver* observer = nullptr, std::unique_ptr<ClipboardProvider> clipboard = nullptr);

  ~IngestionCoordinator();

  IngestionCoordinator(const IngestionCoordinator&) = delete;
  IngestionCoordinator& operator=(const IngestionCoordinator&) = delete;

  absl::StatusOr<Attachment> SubmitFilePath(std::string_view path);
  absl::StatusOr<Attachment> Submit(const Candidate& candidate,
                                    std::shared_ptr<CancellationRequest> cancellation = nullptr);

  // Always materializes `bytes` as a fresh scratch file. An empty `mime_type`
  // is sniffed from `filename`.
  absl::StatusOr<Attachment> SubmitBuffer(std::string_view bytes, std::string_view filename,
                                          std::string_view mime_type = "", Origin origin = Origin::kUpload);

  PasteOutcome Paste();
  std::vector<Attachment> SubmitFromClipboardCommand();

  // Hands raw terminal input to the drag detection engine. Never blocks on I/O
  // beyond writing inline transfers to scratch.
  void SubmitRawTerminalBytes(std::string_view bytes);
  // Scans input held back as incomplete. Line-oriented callers call this once
  // a line has been fully submitted.
  void FlushTerminalInput();

  std::vector<Attachment> ListAttachments() const;
  std::optional<Attachment> GetAttachment(std::string_view id) const;
  AttachmentStats Stats() const;
  absl::Status RemoveAttachment(std::string_view id);
  int ClearAttachments();

  absl::Status StartDetection();
  // Polls the watch directories once, outside the background cadence.
  void ScanWatchDirectories();
  DragEngineStats DetectionStats() const;
  // Drag-origin paths held for re-drop rejection. Entries older than the
  // detection window are pruned on the next submission.
  size_t RecentDropCount() const;

  // Blocks until every queued detector submission has finished.
  void WaitIdle();

  // Stops detection, cancels in-flight work, drains the workers and sweeps the
  // scratch directory. Idempotent; later submissions fail with Cancelled.
  void Shutdown();

  const IngestConfig& config() const { return config_; }

 private:
  IngestionCoordinator(IngestConfig config, IngestObserver* observer, std::unique_ptr<AttachmentRegistry> registry,
                       std::unique_ptr<ClipboardProvider> clipboard);

  absl::StatusOr<Attachment> Ingest(const Candidate& candidate, const std::string& resolved,
                                    const std::shared_ptr<CancellationRequest>& cancellation);
  absl::StatusOr<Attachment> RegisterScratchFile(const std::string& temp_path, std::string filename,
                                                 std::string mime_type, int64_t size_bytes, Origin origin);
  void OnDetected(const DetectionSession& session, std::vector<DragCandidate> candidates,
                  std::shared_ptr<CancellationRequest> cancellation);
  void ProcessSession(const DetectionSession& session, const std::vector<DragCandidate>& candidates,
                      const std::shared_ptr<CancellationRequest>& cancellation);
  void DiscardScratchFile(const std::string& path);
  bool IsShutDown() const;

  const IngestConfig config_;
  IngestObserver* const observer_;

  std::unique_ptr<AttachmentRegistry> registry_;
  ClipboardSource clipboard_;
  StabilityTracker drag_stability_;
  StabilityTracker explicit_stability_;
  std::unique_ptr<TaskRunner> runner_;
  std::unique_ptr<DragDetectionEngine> engine_;

  mutable absl::Mutex mu_;
  absl::flat_hash_set<std::string> processing_ ABSL_GUARDED_BY(mu_);
  // Drag-origin paths and when they were last ingested.
  absl::flat_hash_map<std::string, absl::Time> recent_ ABSL_GUARDED_BY(mu_);
  bool shut_down_ ABSL_GUARDED_BY(mu_) = false;
};

}  // namespace dropin

#endif  // DROPIN_INGESTION_COORDINATOR_H_
