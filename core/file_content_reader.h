#ifndef DROPIN_FILE_CONTENT_READER_H_
#define DROPIN_FILE_CONTENT_READER_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

#include "core/attachment_types.h"
#include "core/constants.h"

namespace dropin {

struct ReadLimits {
  int64_t max_file_size_bytes = kDefaultMaxFileSizeBytes;
  int64_t max_image_size_bytes = kDefaultMaxImageSizeBytes;
};

struct FileContent {
  std::string absolute_path;
  std::string filename;
  std::string bytes;
  std::string mime_type;
  int64_t size_bytes = 0;
  AttachmentKind kind = AttachmentKind::kFile;
};

// Expands a leading "~" and returns the lexically normal absolute form of `path`.
std::string ResolvePath(std::string_view path);

// True if `path` resolves to an existing regular file (symlinks followed).
bool IsRegularFile(std::string_view path);

/**
 * @brief Reads a file into memory after validating it.
 *
 * Fails with NotFound if nothing exists at the path, NotAFile for directories
 * and other non-regular entries, TooLarge when the size exceeds the ceiling for
 * the sniffed kind, and IoFailure when the read itself fails or comes up short.
 * Has no side effects and may be called from any thread.
 */
absl::StatusOr<FileContent> ReadFileContent(std::string_view path, const ReadLimits& limits = {});

// Like ReadFileContent, but also requires a supported image mime type (UnsupportedType otherwise).
absl::StatusOr<FileContent> ReadImageContent(std::string_view path, const ReadLimits& limits = {});


}  // namespace dropin

#endif  // DROPIN_FILE_CONTENT_READER_H_
