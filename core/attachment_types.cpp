#include "core/attachment_types.h"

#include <fstream>
#include <sstream>

#include "absl/strings/escaping.h"

#include "core/ingest_error.h"

namespace dropin {

std::string_view AttachmentKindName(AttachmentKind kind) {
  switch (kind) {
    case AttachmentKind::kFile:
      return "file";
    case AttachmentKind::kImage:
      return "image";
  }
  return "file";
}

std::string_view OriginName(Origin origin) {
  switch (origin) {
    case Origin::kPaste:
      return "paste";
    case Origin::kDrag:
      return "drag";
    case Origin::kUpload:
      return "upload";
    case Origin::kFileReference:
      return "file-reference";
  }
  return "file-reference";
}

std::string_view SessionStatusName(SessionStatus status) {
  switch (status) {
    case SessionStatus::kCollecting:
      return "collecting";
    case SessionStatus::kSettling:
      return "settling";
    case SessionStatus::kCommitted:
      return "committed";
    case SessionStatus::kExpired:
      return "expired";
  }
  return "collecting";
}

absl::StatusOr<std::string> LoadAttachmentBytes(const Attachment& attachment) {
  if (!attachment.is_temp_file()) return attachment.bytes;

  std::ifstream file(*attachment.temp_path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return IngestError(IngestErrorKind::kIoFailure, "Could not open temp file: " + *attachment.temp_path);
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

absl::StatusOr<nlohmann::json> ToRequestPart(const Attachment& attachment) {
  auto bytes_or = LoadAttachmentBytes(attachment);
  if (!bytes_or.ok()) return bytes_or.status();

  nlohmann::json part = attachment;
  part["data"] = absl::Base64Escape(*bytes_or);
  return part;
}

void to_json(nlohmann::json& j, const AttachmentSource& source) {
  j = nlohmann::json{{"origin", std::string(OriginName(source.origin))},
                     {"observed_at", absl::FormatTime(source.observed_at, absl::UTCTimeZone())}};
  if (source.original_path) j["original_path"] = *source.original_path;
}

void to_json(nlohmann::json& j, const Attachment& attachment) {
  j = nlohmann::json{{"id", attachment.id},
                     {"filename", attachment.filename},
                     {"mime_type", attachment.mime_type},
                     {"size", attachment.size_bytes},
                     {"kind", std::string(AttachmentKindName(attachment.kind))},
                     {"source", attachment.source},
                     {"is_temp_file", attachment.is_temp_file()}};
  if (attachment.temp_path) j["temp_path"] = *attachment.temp_path;
}

void to_json(nlohmann::json& j, const AttachmentStats& stats) {
  j = nlohmann::json{{"count", stats.count},
                     {"total_size", stats.total_size},
                     {"file_count", stats.file_count},
                     {"image_count", stats.image_count},
                     {"temp_file_count", stats.temp_file_count}};
}

}  // namespace dropin
