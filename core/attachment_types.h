#ifndef DROPIN_ATTACHMENT_TYPES_H_
#define DROPIN_ATTACHMENT_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "nlohmann/json.hpp"

namespace dropin {

enum class AttachmentKind { kFile, kImage };

enum class Origin { kPaste, kDrag, kUpload, kFileReference };

struct AttachmentSource {
  Origin origin = Origin::kFileReference;
  std::optional<std::string> original_path;
  absl::Time observed_at = absl::InfinitePast();
};

/**
 * @brief A registered, quota-counted file or image.
 *
 * Content lives either in `bytes` or in the scratch file at `temp_path`, never
 * both. When `temp_path` is set the file exists and belongs to this attachment
 * alone; the registry unlinks it when the attachment goes away.
 */
struct Attachment {
  std::string id;
  std::string filename;
  std::string mime_type;
  int64_t size_bytes = 0;
  AttachmentKind kind = AttachmentKind::kFile;
  AttachmentSource source;
  std::string bytes;
  std::optional<std::string> temp_path;

  bool is_temp_file() const { return temp_path.has_value(); }
};

struct AttachmentStats {
  int count = 0;
  int64_t total_size = 0;
  int file_count = 0;
  int image_count = 0;
  int temp_file_count = 0;
};

enum class SessionStatus { kCollecting, kSettling, kCommitted, kExpired };

// Bookkeeping for one drag or paste gesture.
struct DetectionSession {
  std::string session_id;
  absl::Time started_at = absl::InfinitePast();
  std::vector<std::string> candidate_paths;
  SessionStatus status = SessionStatus::kCollecting;
};

std::string_view AttachmentKindName(AttachmentKind kind);
std::string_view OriginName(Origin origin);
std::string_view SessionStatusName(SessionStatus status);

// Loads the attachment content, from memory or from its scratch file.
absl::StatusOr<std::string> LoadAttachmentBytes(const Attachment& attachment);

// Builds the part handed to a downstream request: metadata plus base64 `data`.
absl::StatusOr<nlohmann::json> ToRequestPart(const Attachment& attachment);

void to_json(nlohmann::json& j, const AttachmentSource& source);
void to_json(nlohmann::json& j, const Attachment& attachment);
void to_json(nlohmann::json& j, const AttachmentStats& stats);

}  // namespace dropin

#endif  // DROPIN_ATTACHMENT_TYPES_H_
