#ifndef DROPIN_INGEST_OBSERVER_H_
#define DROPIN_INGEST_OBSERVER_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"

#include "core/attachment_types.h"

namespace dropin {

/**
 * @brief Receives pipeline events.
 *
 * Methods may be called from the input thread, the poll thread or a task
 * runner worker, but never while a pipeline lock is held. Implementations must
 * be thread-safe. Every method defaults to a no-op.
 */
class IngestObserver {
 public:
  virtual ~IngestObserver() = default;

  virtual void OnAttachmentAdded(const Attachment& attachment) {}
  virtual void OnAttachmentRemoved(const Attachment& attachment) {}

  virtual void OnDragSessionStarted(const DetectionSession& session) {}
  virtual void OnDragSessionProgress(const DetectionSession& session, std::string_view message) {}
  virtual void OnDragSessionCompleted(const DetectionSession& session, const std::vector<Attachment>& added) {}
  virtual void OnDragSessionError(const DetectionSession& session, const absl::Status& status) {}
};

}  // namespace dropin

#endif  // DROPIN_INGEST_OBSERVER_H_
