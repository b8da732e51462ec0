#ifndef DROPIN_DRAG_DETECTION_ENGINE_H_
#define DROPIN_DRAG_DETECTION_ENGINE_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

#include "core/attachment_types.h"
#include "core/cancellation.h"
#include "core/directory_poller.h"
#include "core/ingest_observer.h"
#include "core/scratch_directory.h"
#include "core/terminal_input_scanner.h"

namespace dropin {

// A file the engine believes was dropped, not yet validated or registered.
struct DragCandidate {
  std::string path;
  std::string display_name;
  int64_t observed_size = -1;
  bool from_poll = false;
  // `path` is a scratch file the engine wrote (inline transfers); whoever
  // consumes the candidate owns it from then on.
  bool scratch_owned = false;
};

struct DragEngineOptions {
  std::vector<std::string> watch_directories;
  absl::Duration poll_interval = absl::Milliseconds(500);
  absl::Duration detection_window = absl::Seconds(3);
  absl::Duration session_timeout = absl::Seconds(8);
  bool enable_polling = true;
};

struct DragEngineStats {
  bool active = false;
  bool dragging = false;
  std::string session_id;
  int open_sessions = 0;
  size_t known_files = 0;
};

// Receives each closed gesture's candidates. Called without engine locks held.
using CandidateSink = std::function<void(const DetectionSession& session, std::vector<DragCandidate> candidates,
                                         std::shared_ptr<CancellationRequest> cancellation)>;

/**
 * @brief Turns raw terminal input and drop-directory changes into candidates.
 *
 * Mouse reports drive a per-gesture DetectionSession: a press opens one, motion
 * reports progress, a cancel (other button) expires it. Paths found in the
 * input close the open session and are handed to the sink together; a release
 * with nothing found triggers an immediate directory poll instead. A background
 * thread polls the watch directories and expires sessions that outlive the
 * detection window (while collecting), or that spend longer than the session
 * timeout on one candidate (while settling).
 */
class DragDetectionEngine {
 public:
  DragDetectionEngine(DragEngineOptions options, ScratchDirectory* scratch, IngestObserver* observer,
                      CandidateSink sink);
  ~DragDetectionEngine();

  DragDetectionEngine(const DragDetectionEngine&) = delete;
  DragDetectionEngine& operator=(const DragDetectionEngine&) = delete;

  // Launches the poll thread. Idempotent.
  absl::Status Start();

  // Cancels every session, stops the poll thread and joins it. Idempotent.
  void Stop();

  void Feed(std::string_view bytes);

  // Scans input held back as incomplete.
  void Flush();

  void PollOnce(absl::Time now);
  void ExpireStaleSessions(absl::Time now);

  // Restarts the settle clock of a handed-off session, so each candidate gets
  // a full session_timeout. Returns false once the session expired.
  bool RenewSession(std::string_view session_id, absl::Time now);

  // Marks a handed-off session committed and forgets it. Returns false if the
  // session expired (or was cancelled) first.
  bool FinishSession(std::string_view session_id);

  DragEngineStats GetStats() const;
  bool IsActive() const;

 private:
  struct SessionState {
    DetectionSession session;
    std::shared_ptr<CancellationRequest> cancellation;
    bool dragging = false;
    // Start of the current settle budget while kSettling.
    absl::Time settle_started = absl::InfinitePast();
  };

  struct Notice {
    enum class Kind { kStarted, kProgress, kError };
    Kind kind;
    DetectionSession session;
    std::string message;
    absl::Status status;
  };

  struct Handoff {
    DetectionSession session;
    std::vector<DragCandidate> candidates;
    std::shared_ptr<CancellationRequest> cancellation;
  };

  void HandleEvents(std::vector<ScanEvent> events, absl::Time now);

  std::optional<DragCandidate> CandidateFromPath(std::string_view raw, absl::Time now);
  absl::StatusOr<DragCandidate> CandidateFromInline(const ScanEvent& event);

  SessionState* OpenSession() ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  SessionState& OpenOrCreateSession(absl::Time now, std::vector<Notice>& notices) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void HandOff(std::vector<DragCandidate> candidates, absl::Time now, std::vector<Notice>& notices,
               std::vector<Handoff>& handoffs) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);
  void Expire(SessionState& state, absl::Status reason, std::vector<Notice>& notices)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  void Deliver(std::vector<Notice> notices, std::vector<Handoff> handoffs);
  void PollLoop(std::shared_ptr<CancellationRequest> stop);

  const DragEngineOptions options_;
  ScratchDirectory* const scratch_;
  IngestObserver* const observer_;
  const CandidateSink sink_;

  DirectoryPoller poller_;

  absl::Mutex scanner_mu_;
  TerminalInputScanner scanner_ ABSL_GUARDED_BY(scanner_mu_);

  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, SessionState> sessions_ ABSL_GUARDED_BY(mu_);
  std::string open_session_id_ ABSL_GUARDED_BY(mu_);
  int64_t next_session_ ABSL_GUARDED_BY(mu_) = 0;
  std::shared_ptr<CancellationRequest> stop_ ABSL_GUARDED_BY(mu_);
  // Set by Stop(); later candidates are dropped instead of handed off.
  bool stopped_ ABSL_GUARDED_BY(mu_) = false;

  // Held across join; the poll thread never takes it.
  absl::Mutex lifecycle_mu_;
  std::thread poll_thread_ ABSL_GUARDED_BY(lifecycle_mu_);
};

}  // namespace dropin

#endif  // DROPIN_DRAG_DETECTION_ENGINE_H_
