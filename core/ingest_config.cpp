#include "core/ingest_config.h"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "absl/strings/str_cat.h"

namespace dropin {

std::string SystemTempDirectory() {
  const char* env = std::getenv("TMPDIR");
  if (env != nullptr && *env != '\0') return env;
  std::error_code ec;
  std::filesystem::path tmp = std::filesystem::temp_directory_path(ec);
  if (ec) return "/tmp";
  return tmp.string();
}

std::string DefaultScratchDirectory() {
  return (std::filesystem::path(SystemTempDirectory()) / kScratchDirName).string();
}

absl::Status ValidateConfig(const IngestConfig& config) {
  if (config.max_attachments <= 0) {
    return absl::InvalidArgumentError(absl::StrCat("max_attachments must be positive, got ", config.max_attachments));
  }
  if (config.max_total_size_bytes <= 0) {
    return absl::InvalidArgumentError("max_total_size_bytes must be positive");
  }
  if (config.max_file_size_bytes <= 0 || config.max_image_size_bytes <= 0 || config.max_drag_file_size_bytes <= 0) {
    return absl::InvalidArgumentError("Per-file size ceilings must be positive");
  }
  if (config.detection_window <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("detection_window must be positive");
  }
  if (config.session_timeout < config.detection_window) {
    return absl::InvalidArgumentError("session_timeout must not be shorter than detection_window");
  }
  if (config.poll_interval <= absl::ZeroDuration() || config.poll_interval > absl::Seconds(1)) {
    return absl::InvalidArgumentError(
        absl::StrCat("poll_interval must be in (0, 1s], got ", absl::FormatDuration(config.poll_interval)));
  }
  if (config.stability.settle_delay <= absl::ZeroDuration() || config.explicit_settle_delay <= absl::ZeroDuration() ||
      config.stability.backoff < 1.0 || config.stability.max_retries < 0) {
    return absl::InvalidArgumentError("Invalid stability settings");
  }
  if (config.worker_threads < 1) {
    return absl::InvalidArgumentError("worker_threads must be at least 1");
  }
  return absl::OkStatus();
}

}  // namespace dropin
