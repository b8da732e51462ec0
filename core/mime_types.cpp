#include "core/mime_types.h"

#include <filesystem>

#include "absl/base/no_destructor.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"

namespace dropin {

namespace {

const absl::flat_hash_map<std::string, std::string>& MimeTable() {
  static const absl::NoDestructor<absl::flat_hash_map<std::string, std::string>> kTable({
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".png", "image/png"},
      {".gif", "image/gif"},
      {".webp", "image/webp"},
      {".bmp", "image/bmp"},
      {".svg", "image/svg+xml"},
      {".ico", "image/x-icon"},
      {".pdf", "application/pdf"},
      {".txt", "text/plain"},
      {".log", "text/plain"},
      {".md", "text/markdown"},
      {".js", "application/javascript"},
      {".ts", "application/typescript"},
      {".json", "application/json"},
      {".html", "text/html"},
      {".css", "text/css"},
      {".py", "text/x-python"},
      {".java", "text/x-java-source"},
      {".cpp", "text/x-c++"},
      {".cc", "text/x-c++"},
      {".h", "text/x-c"},
      {".c", "text/x-c"},
      {".go", "text/x-go"},
      {".rs", "text/x-rust"},
      {".php", "text/x-php"},
      {".rb", "text/x-ruby"},
      {".swift", "text/x-swift"},
      {".kt", "text/x-kotlin"},
      {".scala", "text/x-scala"},
      {".sql", "text/x-sql"},
      {".xml", "application/xml"},
      {".yaml", "application/x-yaml"},
      {".yml", "application/x-yaml"},
      {".csv", "text/csv"},
      {".zip", "application/zip"},
      {".gz", "application/gzip"},
      {".tar", "application/x-tar"},
      {".doc", "application/msword"},
      {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
      {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
      {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
  });
  return *kTable;
}

bool OneOf(std::string_view ext, std::initializer_list<std::string_view> exts) {
  for (std::string_view e : exts) {
    if (ext == e) return true;
  }
  return false;
}

}  // namespace

std::string FileExtension(std::string_view path) {
  std::string ext = std::filesystem::path(std::string(path)).filename().extension().string();
  return absl::AsciiStrToLower(ext);
}

std::string MimeTypeForPath(std::string_view path) {
  const auto& table = MimeTable();
  auto it = table.find(FileExtension(path));
  if (it == table.end()) return kDefaultMimeType;
  return it->second;
}

bool IsImageMimeType(std::string_view mime_type) { return absl::StartsWith(mime_type, "image/"); }

bool IsSupportedImageMimeType(std::string_view mime_type) {
  static const absl::NoDestructor<absl::flat_hash_set<std::string>> kSupported(
      {"image/jpeg", "image/png", "image/gif", "image/webp", "image/bmp", "image/svg+xml"});
  return kSupported->contains(mime_type);
}

std::string ExtensionForImageMimeType(std::string_view mime_type) {
  if (mime_type == "image/jpeg") return ".jpg";
  if (mime_type == "image/gif") return ".gif";
  if (mime_type == "image/webp") return ".webp";
  if (mime_type == "image/bmp") return ".bmp";
  return ".png";
}

FileCategory ClassifyFile(std::string_view path) {
  std::string ext = FileExtension(path);
  if (OneOf(ext, {".png", ".jpg", ".jpeg", ".gif", ".webp", ".bmp", ".svg", ".ico"})) return FileCategory::kImage;
  if (OneOf(ext, {".pdf", ".doc", ".docx", ".txt", ".md", ".rtf"})) return FileCategory::kDocument;

  std::string name = absl::AsciiStrToLower(std::filesystem::path(std::string(path)).filename().string());
  if (OneOf(ext, {".json", ".xml", ".yaml", ".yml", ".log", ".csv", ".js", ".ts", ".py", ".java", ".cpp"}) ||
      absl::StrContains(name, "readme")) {
    return FileCategory::kText;
  }
  if (OneOf(ext, {".exe", ".dmg", ".pkg", ".deb", ".rpm", ".zip", ".tar", ".gz"})) return FileCategory::kBinary;
  return FileCategory::kUnknown;
}

std::string_view FileCategoryName(FileCategory category) {
  switch (category) {
    case FileCategory::kImage:
      return "image";
    case FileCategory::kDocument:
      return "document";
    case FileCategory::kText:
      return "text";
    case FileCategory::kBinary:
      return "binary";
    case FileCategory::kUnknown:
      return "unknown";
  }
  return "unknown";
}

}  // namespace dropin
