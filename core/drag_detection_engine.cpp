#include "core/drag_detection_engine.h"

#include <sys/stat.h>

#include <filesystem>
#include <system_error>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "core/constants.h"
#include "core/file_content_reader.h"
#include "core/ingest_error.h"

namespace dropin {

namespace fs = std::filesystem;

DragDetectionEngine::DragDetectionEngine(DragEngineOptions options, ScratchDirectory* scratch,
                                         IngestObserver* observer, CandidateSink sink)
    : options_(std::move(options)),
      scratch_(scratch),
      observer_(observer),
      sink_(std::move(sink)),
      poller_(options_.watch_directories, options_.detection_window, scratch ? scratch->root() : "") {}

DragDetectionEngine::~DragDetectionEngine() { Stop(); }

absl::Status DragDetectionEngine::Start() {
  absl::MutexLock lifecycle(&lifecycle_mu_);
  if (poll_thread_.joinable()) return absl::OkStatus();

  for (const std::string& dir : options_.watch_directories) {
    if (fs::path(dir).filename() != kDragDropDirName) continue;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) LOG(WARNING) << "Could not create drop directory " << dir << ": " << ec.message();
  }

  auto stop = std::make_shared<CancellationRequest>();
  {
    absl::MutexLock lock(&mu_);
    stop_ = stop;
    stopped_ = false;
  }
  poll_thread_ = std::thread(&DragDetectionEngine::PollLoop, this, stop);
  LOG(INFO) << "Drag detection started; watching " << options_.watch_directories.size() << " director"
            << (options_.watch_directories.size() == 1 ? "y" : "ies")
            << (options_.enable_polling ? "" : " (polling disabled)");
  return absl::OkStatus();
}

void DragDetectionEngine::Stop() {
  absl::MutexLock lifecycle(&lifecycle_mu_);
  std::shared_ptr<CancellationRequest> stop;
  std::vector<std::shared_ptr<CancellationRequest>> sessions;
  {
    absl::MutexLock lock(&mu_);
    stop = std::move(stop_);
    stop_.reset();
    stopped_ = true;
    for (auto& [id, state] : sessions_) {
      state.session.status = SessionStatus::kExpired;
      sessions.push_back(state.cancellation);
    }
    open_session_id_.clear();
  }
  if (stop) stop->Cancel();
  for (auto& cancellation : sessions) cancellation->Cancel();
  if (poll_thread_.joinable()) {
    poll_thread_.join();
    LOG(INFO) << "Drag detection stopped";
  }
}

bool DragDetectionEngine::IsActive() const {
  absl::ReaderMutexLock lock(&mu_);
  return stop_ != nullptr;
}

void DragDetectionEngine::PollLoop(std::shared_ptr<CancellationRequest> stop) {
  while (!stop->WaitForCancellation(options_.poll_interval)) {
    absl::Time now = absl::Now();
    if (options_.enable_polling) PollOnce(now);
    ExpireStaleSessions(now);
  }
}

void DragDetectionEngine::Feed(std::string_view bytes) {
  std::vector<ScanEvent> events;
  {
    absl::MutexLock lock(&scanner_mu_);
    events = scanner_.Feed(bytes);
  }
  if (!events.empty()) HandleEvents(std::move(events), absl::Now());
}

void DragDetectionEngine::Flush() {
  std::vector<ScanEvent> events;
  {
    absl::MutexLock lock(&scanner_mu_);
    events = scanner_.Flush();
  }
  if (!events.empty()) HandleEvents(std::move(events), absl::Now());
}

std::optional<DragCandidate> DragDetectionEngine::CandidateFromPath(std::string_view raw, absl::Time now) {
  std::string path = ResolvePath(raw);
  struct stat st;
  if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    VLOG(1) << "Ignoring path that is not an existing file: " << raw;
    return std::nullopt;
  }
  std::string name = fs::path(path).filename().string();
  if (ShouldIgnoreFile(name) || (scratch_ != nullptr && scratch_->Owns(path))) {
    VLOG(1) << "Ignoring internal or implausible file: " << path;
    return std::nullopt;
  }
  poller_.MarkKnown(path, now);

  DragCandidate candidate;
  candidate.path = std::move(path);
  candidate.display_name = std::move(name);
  candidate.observed_size = static_cast<int64_t>(st.st_size);
  return candidate;
}

absl::StatusOr<DragCandidate> DragDetectionEngine::CandidateFromInline(const ScanEvent& event) {
  if (scratch_ == nullptr) {
    return absl::FailedPreconditionError("No scratch directory for inline file transfers");
  }
  auto path_or = scratch_->Materialize(event.payload, event.filename);
  if (!path_or.ok()) return path_or.status();

  DragCandidate candidate;
  candidate.path = *std::move(path_or);
  candidate.display_name = event.filename;
  candidate.observed_size = static_cast<int64_t>(event.payload.size());
  candidate.scratch_owned = true;
  return candidate;
}

DragDetectionEngine::SessionState* DragDetectionEngine::OpenSession() {
  if (open_session_id_.empty()) return nullptr;
  auto it = sessions_.find(open_session_id_);
  if (it == sessions_.end() || it->second.session.status != SessionStatus::kCollecting) {
    open_session_id_.clear();
    return nullptr;
  }
  return &it->second;
}

DragDetectionEngine::SessionState& DragDetectionEngine::OpenOrCreateSession(absl::Time now,
                                                                             std::vector<Notice>& notices) {
  if (SessionState* open = OpenSession()) return *open;

  SessionState state;
  state.session.session_id = absl::StrCat(kSessionIdPrefix, absl::ToUnixMillis(now), "-", ++next_session_);
  state.session.started_at = now;
  state.session.status = SessionStatus::kCollecting;
  state.cancellation = std::make_shared<CancellationRequest>();
  open_session_id_ = state.session.session_id;

  notices.push_back(Notice{Notice::Kind::kStarted, state.session, "", absl::OkStatus()});
  auto [it, inserted] = sessions_.emplace(open_session_id_, std::move(state));
  return it->second;
}

void DragDetectionEngine::HandOff(std::vector<DragCandidate> candidates, absl::Time now, std::vector<Notice>& notices,
                                  std::vector<Handoff>& handoffs) {
  SessionState& state = OpenOrCreateSession(now, notices);
  for (const DragCandidate& c : candidates) state.session.candidate_paths.push_back(c.path);
  state.session.status = SessionStatus::kSettling;
  state.settle_started = now;
  state.dragging = false;
  open_session_id_.clear();

  notices.push_back(Notice{Notice::Kind::kProgress, state.session,
                           absl::StrCat("Detected ", candidates.size(), " file(s), waiting for them to settle"),
                           absl::OkStatus()});
  handoffs.push_back(Handoff{state.session, std::move(candidates), state.cancellation});
}

void DragDetectionEngine::Expire(SessionState& state, absl::Status reason, std::vector<Notice>& notices) {
  state.session.status = SessionStatus::kExpired;
  state.cancellation->Cancel();
  if (open_session_id_ == state.session.session_id) open_session_id_.clear();
  notices.push_back(Notice{Notice::Kind::kError, state.session, "", std::move(reason)});
}

void DragDetectionEngine::HandleEvents(std::vector<ScanEvent> events, absl::Time now) {
  // File work happens before taking the session lock.
  std::vector<DragCandidate> batch;
  std::vector<absl::Status> failures;
  absl::flat_hash_set<std::string> seen;
  for (const ScanEvent& event : events) {
    VLOG(2) << "Scanned " << ScanEventTypeName(event.type);
    if (event.type == ScanEvent::Type::kPath) {
      if (auto c = CandidateFromPath(event.path, now); c && seen.insert(c->path).second) {
        batch.push_back(*std::move(c));
      }
    } else if (event.type == ScanEvent::Type::kInlineFile) {
      auto c = CandidateFromInline(event);
      if (c.ok()) {
        batch.push_back(*std::move(c));
      } else {
        failures.push_back(c.status());
      }
    } else if (event.type == ScanEvent::Type::kError) {
      failures.push_back(IngestError(IngestErrorKind::kIoFailure, event.message));
    }
  }

  std::vector<Notice> notices;
  std::vector<Handoff> handoffs;
  std::vector<DragCandidate> orphans;
  bool poll_now = false;
  {
    absl::MutexLock lock(&mu_);
    for (const ScanEvent& event : events) {
      switch (event.type) {
        case ScanEvent::Type::kMousePress: {
          SessionState& state = OpenOrCreateSession(now, notices);
          state.dragging = true;
          break;
        }
        case ScanEvent::Type::kMouseDrag: {
          SessionState& state = OpenOrCreateSession(now, notices);
          if (!state.dragging) {
            state.dragging = true;
            notices.push_back(Notice{Notice::Kind::kProgress, state.session,
                                     absl::StrCat("Dragging at (", event.x, ", ", event.y, ")"), absl::OkStatus()});
          }
          break;
        }
        case ScanEvent::Type::kMouseRelease:
          if (SessionState* open = OpenSession()) {
            open->dragging = false;
            if (batch.empty()) poll_now = true;
          }
          break;
        case ScanEvent::Type::kMouseCancel:
          if (SessionState* open = OpenSession()) {
            std::string id = open->session.session_id;
            Expire(*open, absl::CancelledError("Drag cancelled"), notices);
            sessions_.erase(id);
          }
          break;
        default:
          break;
      }
    }

    if (!failures.empty()) {
      if (SessionState* open = OpenSession()) {
        for (absl::Status& failure : failures) {
          notices.push_back(Notice{Notice::Kind::kError, open->session, "", std::move(failure)});
        }
      } else {
        for (const absl::Status& failure : failures) LOG(WARNING) << "Terminal input: " << failure;
      }
    }
    if (!batch.empty()) {
      if (stopped_) {
        orphans.swap(batch);
      } else {
        HandOff(std::move(batch), now, notices, handoffs);
      }
    }
  }

  // Nobody consumes candidates after Stop(); inline transfers were already written.
  for (const DragCandidate& c : orphans) {
    if (!c.scratch_owned || scratch_ == nullptr) continue;
    absl::Status removed = scratch_->Remove(c.path);
    if (!removed.ok()) LOG(WARNING) << "Could not discard " << c.path << ": " << removed;
  }
  Deliver(std::move(notices), std::move(handoffs));
  if (poll_now) PollOnce(now);
}

void DragDetectionEngine::PollOnce(absl::Time now) {
  std::vector<PollCandidate> found = poller_.Poll(now);
  if (found.empty()) return;

  std::vector<DragCandidate> batch;
  batch.reserve(found.size());
  for (PollCandidate& p : found) {
    DragCandidate candidate;
    candidate.display_name = fs::path(p.path).filename().string();
    candidate.path = std::move(p.path);
    candidate.observed_size = p.size_bytes;
    candidate.from_poll = true;
    batch.push_back(std::move(candidate));
  }

  std::vector<Notice> notices;
  std::vector<Handoff> handoffs;
  {
    absl::MutexLock lock(&mu_);
    if (stopped_) return;
    HandOff(std::move(batch), now, notices, handoffs);
  }
  Deliver(std::move(notices), std::move(handoffs));
}

void DragDetectionEngine::ExpireStaleSessions(absl::Time now) {
  std::vector<Notice> notices;
  {
    absl::MutexLock lock(&mu_);
    std::vector<std::string> drop;
    for (auto& [id, state] : sessions_) {
      const absl::Duration age = now - state.session.started_at;
      if (state.session.status == SessionStatus::kCollecting && age > options_.detection_window) {
        Expire(state, IngestError(IngestErrorKind::kStabilityTimeout, "No files detected for this drag"), notices);
        drop.push_back(id);
      } else if (state.session.status == SessionStatus::kSettling &&
                 now - state.settle_started > options_.session_timeout) {
        // Kept until FinishSession so the consumer learns it lost the race.
        Expire(state, IngestError(IngestErrorKind::kStabilityTimeout, "Drag session timed out while settling"),
               notices);
      }
    }
    for (const std::string& id : drop) sessions_.erase(id);
  }
  Deliver(std::move(notices), {});
}

bool DragDetectionEngine::RenewSession(std::string_view session_id, absl::Time now) {
  absl::MutexLock lock(&mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second.session.status != SessionStatus::kSettling) return false;
  it->second.settle_started = now;
  return true;
}

bool DragDetectionEngine::FinishSession(std::string_view session_id) {
  absl::MutexLock lock(&mu_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return false;
  bool committed = it->second.session.status == SessionStatus::kSettling;
  sessions_.erase(it);
  return committed;
}

DragEngineStats DragDetectionEngine::GetStats() const {
  DragEngineStats stats;
  stats.known_files = poller_.known_count();
  absl::ReaderMutexLock lock(&mu_);
  stats.active = stop_ != nullptr;
  stats.open_sessions = static_cast<int>(sessions_.size());
  if (!open_session_id_.empty()) {
    auto it = sessions_.find(open_session_id_);
    if (it != sessions_.end()) {
      stats.session_id = open_session_id_;
      stats.dragging = it->second.dragging;
    }
  }
  return stats;
}

void DragDetectionEngine::Deliver(std::vector<Notice> notices, std::vector<Handoff> handoffs) {
  if (observer_ != nullptr) {
    for (const Notice& notice : notices) {
      switch (notice.kind) {
        case Notice::Kind::kStarted:
          observer_->OnDragSessionStarted(notice.session);
          break;
        case Notice::Kind::kProgress:
          observer_->OnDragSessionProgress(notice.session, notice.message);
          break;
        case Notice::Kind::kError:
          observer_->OnDragSessionError(notice.session, notice.status);
          break;
      }
    }
  }
  for (Handoff& handoff : handoffs) {
    if (sink_) {
      sink_(handoff.session, std::move(handoff.candidates), std::move(handoff.cancellation));
    }
  }
}

}  // namespace dropin
