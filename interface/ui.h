#ifndef DROPIN_UI_H_
#define DROPIN_UI_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"

#include "core/attachment_types.h"
#include "core/drag_detection_engine.h"
#include "core/ingest_observer.h"
#include "interface/color.h"

namespace dropin {

void SetupTerminal();

void ShowBanner();
void SetCompletionCommands(const std::vector<std::string>& commands,
                           const absl::flat_hash_map<std::string, std::vector<std::string>>& sub_commands = {});

// Returns "/exit" on EOF or once a shutdown signal arrived.
std::string ReadLine(const std::string& modeline);

// SIGINT and SIGTERM only record the request; the input loop polls it.
void InstallShutdownSignalHandlers();
bool ShutdownRequested();

// Returns terminal width or 80 if detection fails.
size_t GetTerminalWidth();

// "512 B", "1.5 KB", "2.0 MB".
std::string FormatFileSize(int64_t bytes);

// One line per attachment, or a hint when there are none.
std::string FormatAttachmentList(const std::vector<Attachment>& attachments);

std::string FormatStats(const AttachmentStats& stats, int max_attachments, int64_t max_total_size_bytes,
                        const DragEngineStats& detection);

// "[QuotaExceeded] <message>" for ingest errors, the plain message otherwise.
std::string FormatRejection(const absl::Status& status);

/**
 * @brief Logs an error status if it is not OK.
 *
 * @param status The status to handle.
 * @param context Optional context message to prepend to the error.
 */
void HandleStatus(const absl::Status& status, const std::string& context = "");

/**
 * @brief Prints pipeline events as they happen.
 *
 * Events arrive from worker threads, so every write is serialized.
 */
class ConsoleObserver : public IngestObserver {
 public:
  explicit ConsoleObserver(std::ostream& out);

  void OnAttachmentAdded(const Attachment& attachment) override;
  void OnAttachmentRemoved(const Attachment& attachment) override;
  void OnDragSessionStarted(const DetectionSession& session) override;
  void OnDragSessionProgress(const DetectionSession& session, std::string_view message) override;
  void OnDragSessionCompleted(const DetectionSession& session, const std::vector<Attachment>& added) override;
  void OnDragSessionError(const DetectionSession& session, const absl::Status& status) override;

 private:
  void Print(const std::string& line);

  absl::Mutex mu_;
  std::ostream* const out_ ABSL_PT_GUARDED_BY(mu_);
};

}  // namespace dropin

#endif  // DROPIN_UI_H_
