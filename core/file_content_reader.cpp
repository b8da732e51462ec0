#include "core/file_content_reader.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

#include "core/ingest_error.h"
#include "core/mime_types.h"
#include "core/status_macros.h"

namespace dropin {

namespace fs = std::filesystem;

namespace {

std::string MegabytesString(int64_t bytes) {
  return absl::StrFormat("%.2fMB", static_cast<double>(bytes) / static_cast<double>(kMiB));
}

}  // namespace

std::string ResolvePath(std::string_view path) {
  std::string expanded(path);
  if (!expanded.empty() && expanded[0] == '~' && (expanded.size() == 1 || expanded[1] == '/')) {
    const char* home = std::getenv("HOME");
    if (home != nullptr) expanded = std::string(home) + expanded.substr(1);
  }
  std::error_code ec;
  fs::path absolute = fs::absolute(fs::path(expanded), ec);
  if (ec) return fs::path(expanded).lexically_normal().string();
  return absolute.lexically_normal().string();
}

bool IsRegularFile(std::string_view path) {
  std::error_code ec;
  return fs::is_regular_file(ResolvePath(path), ec);
}

absl::StatusOr<FileContent> ReadFileContent(std::string_view path, const ReadLimits& limits) {
  std::string resolved = ResolvePath(path);

  std::error_code ec;
  fs::file_status status = fs::status(resolved, ec);
  if (ec || !fs::exists(status)) {
    return IngestError(IngestErrorKind::kNotFound, absl::StrCat("File does not exist: ", path));
  }
  if (!fs::is_regular_file(status)) {
    return IngestError(IngestErrorKind::kNotAFile, absl::StrCat("Not a regular file: ", path));
  }

  uintmax_t raw_size = fs::file_size(resolved, ec);
  if (ec) {
    return IngestError(IngestErrorKind::kIoFailure, absl::StrCat("Could not stat ", path, ": ", ec.message()));
  }
  int64_t size = static_cast<int64_t>(raw_size);

  std::string mime_type = MimeTypeForPath(resolved);
  AttachmentKind kind = IsImageMimeType(mime_type) ? AttachmentKind::kImage : AttachmentKind::kFile;
  int64_t ceiling = kind == AttachmentKind::kImage ? limits.max_image_size_bytes : limits.max_file_size_bytes;
  if (size > ceiling) {
    return IngestError(IngestErrorKind::kTooLarge, absl::StrCat("File too large (", MegabytesString(size),
                                                                "), limit is ", MegabytesString(ceiling), ": ", path));
  }

  std::ifstream file(resolved, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return IngestError(IngestErrorKind::kIoFailure, absl::StrCat("Could not open file: ", path));
  }
  std::string bytes(static_cast<size_t>(size), '\0');
  file.read(bytes.data(), size);
  if (file.gcount() != size) {
    return IngestError(IngestErrorKind::kIoFailure,
                       absl::StrCat("Short read on ", path, ": expected ", size, " bytes, got ", file.gcount()));
  }

  FileContent content;
  content.absolute_path = resolved;
  content.filename = fs::path(resolved).filename().string();
  content.bytes = std::move(bytes);
  content.mime_type = std::move(mime_type);
  content.size_bytes = size;
  content.kind = kind;
  return content;
}

absl::StatusOr<FileContent> ReadImageContent(std::string_view path, const ReadLimits& limits) {
  ASSIGN_OR_RETURN(FileContent content, ReadFileContent(path, limits));
  if (!IsImageMimeType(content.mime_type)) {
    return IngestError(IngestErrorKind::kUnsupportedType, absl::StrCat("Not an image (", content.mime_type, "): ", path));
  }
  if (!IsSupportedImageMimeType(content.mime_type)) {
    return IngestError(IngestErrorKind::kUnsupportedType,
                       absl::StrCat("Unsupported image format ", content.mime_type, ": ", path));
  }
  return content;
}

}  // namespace dropin
