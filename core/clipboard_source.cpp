#include "core/clipboard_source.h"

#include <cstdlib>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"

#include "core/constants.h"
#include "core/file_content_reader.h"
#include "core/mime_types.h"
#include "core/path_heuristics.h"
#include "core/shell_util.h"

namespace dropin {

namespace {

constexpr absl::Duration kClipboardTimeout = absl::Seconds(2);

// Formats accepted in a data URI.
bool IsDataUriImageFormat(std::string_view mime_type) {
  return mime_type == "image/jpeg" || mime_type == "image/png" || mime_type == "image/gif" ||
         mime_type == "image/webp" || mime_type == "image/bmp";
}

bool IsBase64Char(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
}

// Matches data:image/<fmt>;base64,<payload> over the whole string.
bool ParseDataUri(std::string_view text, std::string* mime_type, std::string_view* payload) {
  std::string_view rest = text;
  if (!absl::ConsumePrefix(&rest, "data:image/")) return false;
  size_t fmt_end = 0;
  while (fmt_end < rest.size() &&
         (absl::ascii_isalpha(static_cast<unsigned char>(rest[fmt_end])) || rest[fmt_end] == '+')) {
    ++fmt_end;
  }
  if (fmt_end == 0) return false;
  std::string_view fmt = rest.substr(0, fmt_end);
  rest.remove_prefix(fmt_end);
  if (!absl::ConsumePrefix(&rest, ";base64,") || rest.empty()) return false;
  for (char c : rest) {
    if (!IsBase64Char(c)) return false;
  }
  *mime_type = absl::StrCat("image/", absl::AsciiStrToLower(fmt));
  *payload = rest;
  return true;
}

std::string StripAllQuotes(std::string_view s) {
  return std::string(absl::StripAsciiWhitespace(absl::StrReplaceAll(s, {{"\"", ""}, {"'", ""}})));
}

bool IsExistingFileReference(const std::string& candidate) {
  return LooksLikeFilePath(candidate) && IsRegularFile(candidate);
}

}  // namespace

std::string_view ClipboardContentTypeName(ClipboardContent::Type type) {
  switch (type) {
    case ClipboardContent::Type::kText:
      return "text";
    case ClipboardContent::Type::kFile:
      return "file";
    case ClipboardContent::Type::kFiles:
      return "files";
    case ClipboardContent::Type::kImage:
      return "image";
  }
  return "text";
}

SystemClipboardProvider::SystemClipboardProvider() {
  const char* wayland = std::getenv("WAYLAND_DISPLAY");
  if (wayland != nullptr && *wayland != '\0' && CommandExists("wl-paste")) {
    tool_ = "wl-paste";
  } else if (CommandExists("xclip")) {
    tool_ = "xclip";
  } else if (CommandExists("xsel")) {
    tool_ = "xsel";
  } else if (CommandExists("pbpaste")) {
    tool_ = "pbpaste";
  }
  if (tool_.empty()) {
    LOG(WARNING) << "No clipboard helper found (wl-paste, xclip, xsel, pbpaste)";
  } else {
    VLOG(1) << "Using " << tool_ << " for clipboard access";
  }
}

absl::StatusOr<std::string> SystemClipboardProvider::ReadText() {
  std::string command;
  if (tool_ == "wl-paste") {
    command = "wl-paste --no-newline";
  } else if (tool_ == "xclip") {
    command = "xclip -selection clipboard -o";
  } else if (tool_ == "xsel") {
    command = "xsel --clipboard --output";
  } else if (tool_ == "pbpaste") {
    command = "pbpaste";
  } else {
    return absl::UnavailableError("No clipboard helper available");
  }

  CommandOptions options;
  options.timeout = kClipboardTimeout;
  options.max_stdout_bytes = static_cast<size_t>(kDefaultMaxDragFileSizeBytes);
  auto res = RunCommand(command, options);
  if (!res.ok()) return res.status();
  if (res->exit_code != 0) {
    // Helpers exit non-zero for an empty clipboard.
    VLOG(1) << tool_ << " exited with " << res->exit_code << ": " << res->stderr_out;
    return std::string();
  }
  return std::move(res->stdout_out);
}

absl::StatusOr<std::string> SystemClipboardProvider::ReadImagePng() {
  std::string command;
  if (tool_ == "wl-paste") {
    command = "wl-paste --type image/png";
  } else if (tool_ == "xclip") {
    command = "xclip -selection clipboard -t image/png -o";
  } else {
    return absl::UnimplementedError(
        absl::StrCat("Image paste is not supported with ", tool_.empty() ? "no helper" : tool_));
  }

  CommandOptions options;
  options.timeout = kClipboardTimeout;
  options.max_stdout_bytes = static_cast<size_t>(kDefaultMaxDragFileSizeBytes);
  auto res = RunCommand(command, options);
  if (!res.ok()) return res.status();
  if (res->exit_code != 0 || res->stdout_out.empty()) {
    return absl::NotFoundError("Clipboard holds no image");
  }
  return std::move(res->stdout_out);
}

ClipboardSource::ClipboardSource(std::unique_ptr<ClipboardProvider> provider, ScratchDirectory* scratch)
    : provider_(std::move(provider)), scratch_(scratch) {}

ClipboardContent ClipboardSource::Read() {
  std::string text;
  if (provider_ != nullptr) {
    auto text_or = provider_->ReadText();
    if (text_or.ok()) {
      text = *std::move(text_or);
    } else {
      LOG(WARNING) << "Could not read clipboard text: " << text_or.status();
    }
  }

  ClipboardContent content = Classify(text);
  if (content.type != ClipboardContent::Type::kText || !content.text.empty() || provider_ == nullptr) {
    return content;
  }

  auto png_or = provider_->ReadImagePng();
  if (!png_or.ok()) {
    VLOG(1) << "No clipboard image: " << png_or.status();
    return content;
  }
  return MaterializeImage(*png_or, "image/png");
}

ClipboardContent ClipboardSource::Classify(std::string_view text) {
  std::string_view trimmed = absl::StripAsciiWhitespace(text);

  std::string mime_type;
  std::string_view payload;
  if (ParseDataUri(trimmed, &mime_type, &payload) && IsDataUriImageFormat(mime_type)) {
    std::string bytes;
    if (!absl::Base64Unescape(payload, &bytes)) {
      LOG(WARNING) << "Clipboard image data is not valid base64";
      return ClipboardContent();
    }
    return MaterializeImage(bytes, mime_type);
  }

  ClipboardContent content;
  std::string single = StripAllQuotes(trimmed);
  if (IsExistingFileReference(single)) {
    content.type = ClipboardContent::Type::kFile;
    content.paths.push_back(ResolvePath(single));
    content.text = std::string(trimmed);
    return content;
  }

  std::vector<std::string_view> lines = absl::StrSplit(trimmed, '\n', absl::SkipWhitespace());
  if (lines.size() > 1) {
    std::vector<std::string> paths;
    for (std::string_view line : lines) {
      std::string candidate = StripAllQuotes(line);
      if (IsExistingFileReference(candidate)) paths.push_back(ResolvePath(candidate));
    }
    if (paths.size() >= 2) {
      content.type = ClipboardContent::Type::kFiles;
      content.paths = std::move(paths);
      content.text = std::string(trimmed);
      return content;
    }
  }

  content.text = std::string(trimmed);
  return content;
}

ClipboardContent ClipboardSource::MaterializeImage(std::string_view bytes, std::string_view mime_type) {
  if (scratch_ == nullptr) {
    LOG(WARNING) << "No scratch directory for clipboard images";
    return ClipboardContent();
  }
  std::string filename =
      absl::StrCat("pasted-image-", absl::ToUnixMillis(absl::Now()), ExtensionForImageMimeType(mime_type));
  auto path_or = scratch_->Materialize(bytes, filename);
  if (!path_or.ok()) {
    LOG(WARNING) << "Could not save clipboard image: " << path_or.status();
    return ClipboardContent();
  }

  ClipboardContent content;
  content.type = ClipboardContent::Type::kImage;
  content.temp_path = *std::move(path_or);
  content.mime_type = std::string(mime_type);
  content.filename = std::move(filename);
  content.size_bytes = static_cast<int64_t>(bytes.size());
  return content;
}

}  // namespace dropin
