#ifndef DROPIN_INGEST_ERROR_H_
#define DROPIN_INGEST_ERROR_H_

#include <optional>
#include <string_view>

#include "absl/status/status.h"

namespace dropin {

// Why a candidate failed to become an attachment.
enum class IngestErrorKind {
  kNotFound,
  kNotAFile,
  kTooLarge,
  kUnsupportedType,
  kQuotaExceeded,
  kAlreadyRegistered,
  kStabilityTimeout,
  kIoFailure,
};

// Payload key under which the kind name is attached to a status.
inline constexpr char kIngestErrorPayloadUrl[] = "type.dropin/IngestErrorKind";

/**
 * @brief Builds a status carrying an ingest error kind.
 *
 * The canonical code follows the kind (kNotFound, kFailedPrecondition,
 * kOutOfRange, kInvalidArgument, kResourceExhausted, kAlreadyExists,
 * kDeadlineExceeded, kInternal) and the kind itself travels as a payload so it
 * survives being copied through StatusOr and RETURN_IF_ERROR.
 */
absl::Status IngestError(IngestErrorKind kind, std::string_view message);

// Returns the kind attached to `status`, or nullopt for OK and foreign statuses.
std::optional<IngestErrorKind> GetIngestErrorKind(const absl::Status& status);

inline bool IsIngestError(const absl::Status& status, IngestErrorKind kind) {
  return GetIngestErrorKind(status) == kind;
}

std::string_view IngestErrorKindName(IngestErrorKind kind);

absl::StatusCode CanonicalCodeFor(IngestErrorKind kind);

}  // namespace dropin

#endif  // DROPIN_INGEST_ERROR_H_
