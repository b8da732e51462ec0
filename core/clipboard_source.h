#ifndef DROPIN_CLIPBOARD_SOURCE_H_
#define DROPIN_CLIPBOARD_SOURCE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/statusor.h"

#include "core/scratch_directory.h"

namespace dropin {

// Access to the platform clipboard.
class ClipboardProvider {
 public:
  virtual ~ClipboardProvider() = default;

  virtual absl::StatusOr<std::string> ReadText() = 0;

  // PNG bytes when the clipboard holds an image, NotFound when it does not.
  virtual absl::StatusOr<std::string> ReadImagePng() = 0;
};

/**
 * @brief Reads the clipboard through whichever helper is installed.
 *
 * Tries wl-paste (under Wayland), then xclip, xsel and pbpaste. Each call is
 * bounded by a short timeout since X11 helpers can hang without an owner.
 */
class SystemClipboardProvider : public ClipboardProvider {
 public:
  SystemClipboardProvider();

  absl::StatusOr<std::string> ReadText() override;
  absl::StatusOr<std::string> ReadImagePng() override;

  // Name of the helper in use, empty if none was found.
  const std::string& tool() const { return tool_; }

 private:
  std::string tool_;
};

struct ClipboardContent {
  enum class Type { kText, kFile, kFiles, kImage };

  Type type = Type::kText;
  std::string text;

  // Resolved paths of existing regular files (kFile, kFiles).
  std::vector<std::string> paths;

  // kImage: scratch file holding the decoded image.
  std::string temp_path;
  std::string mime_type;
  std::string filename;
  int64_t size_bytes = 0;
};

std::string_view ClipboardContentTypeName(ClipboardContent::Type type);

/**
 * @brief Classifies clipboard content as text, a file, a file list or an image.
 *
 * Order matters: a base64 image data URI is checked first because its payload
 * can contain path-like substrings; then a single existing file; then two or
 * more existing files, one per line; then, when there is no text at all, raw
 * image bytes offered by the provider; otherwise plain text. Never fails:
 * provider errors, bad base64 and write failures all yield empty text.
 */
class ClipboardSource {
 public:
  // `scratch` receives decoded images and must outlive this object.
  ClipboardSource(std::unique_ptr<ClipboardProvider> provider, ScratchDirectory* scratch);

  ClipboardContent Read();

  // Classification of `text` alone, without asking the provider for images.
  ClipboardContent Classify(std::string_view text);

 private:
  ClipboardContent MaterializeImage(std::string_view bytes, std::string_view mime_type);

  std::unique_ptr<ClipboardProvider> provider_;
  ScratchDirectory* const scratch_;
};

}  // namespace dropin

#endif  // DROPIN_CLIPBOARD_SOURCE_H_
