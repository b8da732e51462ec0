#ifndef DROPIN_MIME_TYPES_H_
#define DROPIN_MIME_TYPES_H_

#include <string>
#include <string_view>

namespace dropin {

inline constexpr char kDefaultMimeType[] = "application/octet-stream";

// Coarse grouping used in drag diagnostics.
enum class FileCategory { kImage, kDocument, kText, kBinary, kUnknown };

// Lower-cased extension of the final path component, including the dot ("" if none).
std::string FileExtension(std::string_view path);

// Mime type sniffed from the extension; kDefaultMimeType when unknown.
std::string MimeTypeForPath(std::string_view path);

bool IsImageMimeType(std::string_view mime_type);

// True for the image formats a downstream request accepts.
bool IsSupportedImageMimeType(std::string_view mime_type);

// ".png" for "image/png" and so on; ".png" when unknown.
std::string ExtensionForImageMimeType(std::string_view mime_type);

FileCategory ClassifyFile(std::string_view path);
std::string_view FileCategoryName(FileCategory category);

}  // namespace dropin

#endif  // DROPIN_MIME_TYPES_H_
