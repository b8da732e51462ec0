#include "core/ingest_error.h"

#include <array>
#include <string>

#include "absl/strings/cord.h"

namespace dropin {

namespace {

constexpr std::array<IngestErrorKind, 8> kAllKinds = {
    IngestErrorKind::kNotFound,          IngestErrorKind::kNotAFile,         IngestErrorKind::kTooLarge,
    IngestErrorKind::kUnsupportedType,   IngestErrorKind::kQuotaExceeded,    IngestErrorKind::kAlreadyRegistered,
    IngestErrorKind::kStabilityTimeout,  IngestErrorKind::kIoFailure,
};

}  // namespace

std::string_view IngestErrorKindName(IngestErrorKind kind) {
  switch (kind) {
    case IngestErrorKind::kNotFound:
      return "NotFound";
    case IngestErrorKind::kNotAFile:
      return "NotAFile";
    case IngestErrorKind::kTooLarge:
      return "TooLarge";
    case IngestErrorKind::kUnsupportedType:
      return "UnsupportedType";
    case IngestErrorKind::kQuotaExceeded:
      return "QuotaExceeded";
    case IngestErrorKind::kAlreadyRegistered:
      return "AlreadyRegistered";
    case IngestErrorKind::kStabilityTimeout:
      return "StabilityTimeout";
    case IngestErrorKind::kIoFailure:
      return "IoFailure";
  }
  return "Unknown";
}

absl::StatusCode CanonicalCodeFor(IngestErrorKind kind) {
  switch (kind) {
    case IngestErrorKind::kNotFound:
      return absl::StatusCode::kNotFound;
    case IngestErrorKind::kNotAFile:
      return absl::StatusCode::kFailedPrecondition;
    case IngestErrorKind::kTooLarge:
      return absl::StatusCode::kOutOfRange;
    case IngestErrorKind::kUnsupportedType:
      return absl::StatusCode::kInvalidArgument;
    case IngestErrorKind::kQuotaExceeded:
      return absl::StatusCode::kResourceExhausted;
    case IngestErrorKind::kAlreadyRegistered:
      return absl::StatusCode::kAlreadyExists;
    case IngestErrorKind::kStabilityTimeout:
      return absl::StatusCode::kDeadlineExceeded;
    case IngestErrorKind::kIoFailure:
      return absl::StatusCode::kInternal;
  }
  return absl::StatusCode::kUnknown;
}

absl::Status IngestError(IngestErrorKind kind, std::string_view message) {
  absl::Status status(CanonicalCodeFor(kind), message);
  status.SetPayload(kIngestErrorPayloadUrl, absl::Cord(IngestErrorKindName(kind)));
  return status;
}

std::optional<IngestErrorKind> GetIngestErrorKind(const absl::Status& status) {
  if (status.ok()) return std::nullopt;
  std::optional<absl::Cord> payload = status.GetPayload(kIngestErrorPayloadUrl);
  if (!payload.has_value()) return std::nullopt;
  std::string name(*payload);
  for (IngestErrorKind kind : kAllKinds) {
    if (IngestErrorKindName(kind) == name) return kind;
  }
  return std::nullopt;
}

}  // namespace dropin
