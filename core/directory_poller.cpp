#include "core/directory_poller.h"

#include <sys/stat.h>

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/match.h"

#include "core/constants.h"
#include "core/file_content_reader.h"
#include "core/ingest_config.h"

namespace dropin {

namespace fs = std::filesystem;

namespace {

size_t LeadingCount(std::string_view s, int (*pred)(int)) {
  size_t n = 0;
  while (n < s.size() && pred(static_cast<unsigned char>(s[n]))) ++n;
  return n;
}

int IsLowerHex(int c) { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); }
int IsDigit(int c) { return c >= '0' && c <= '9'; }

}  // namespace

std::vector<std::string> DefaultWatchDirectories() {
  std::string tmp = SystemTempDirectory();
  std::vector<std::string> dirs = {tmp, (fs::path(tmp) / kDragDropDirName).string()};

  std::error_code ec;
  fs::path cwd = fs::current_path(ec);
  if (!ec) {
    dirs.push_back((cwd / "temp").string());
    dirs.push_back((cwd / "dropped-files").string());
  }
  if (const char* home = std::getenv("HOME")) {
    dirs.push_back((fs::path(home) / "Downloads").string());
    dirs.push_back((fs::path(home) / "Desktop").string());
  }
  return dirs;
}

bool ShouldIgnoreFile(std::string_view filename) {
  if (filename.empty() || filename.front() == '.') return true;

  const bool has_extension = !fs::path(std::string(filename)).extension().empty();
  if (!has_extension && (filename.size() > 20 || filename.size() < 3)) return true;

  if (absl::StrContains(filename, "claude-") || absl::StrContains(filename, "dropin-") ||
      absl::StrContains(filename, "cwd") || absl::StrContains(filename, "temp") ||
      absl::StrContains(filename, "tmp")) {
    return true;
  }

  // <13-digit unix millis>-name
  size_t digits = LeadingCount(filename, IsDigit);
  if (digits == 13 && filename.size() > 13 && filename[13] == '-') return true;

  // <8+ hex chars>-name
  size_t hex = LeadingCount(filename, IsLowerHex);
  if (hex >= 8 && hex < filename.size() && filename[hex] == '-') return true;

  return false;
}

DirectoryPoller::DirectoryPoller(std::vector<std::string> directories, absl::Duration detection_window,
                                 std::string scratch_root)
    : directories_(std::move(directories)),
      window_(detection_window),
      scratch_root_(scratch_root.empty() ? "" : ResolvePath(scratch_root)) {}

std::vector<PollCandidate> DirectoryPoller::Poll(absl::Time now) {
  std::vector<PollCandidate> found;
  absl::MutexLock lock(&mu_);
  ExpireKnown(now);

  for (const std::string& dir : directories_) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) continue;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
      const fs::path& entry = it->path();
      std::string path = entry.string();
      if (ShouldIgnoreFile(entry.filename().string())) continue;
      if (!scratch_root_.empty() && absl::StartsWith(path, scratch_root_)) continue;
      if (known_.contains(path)) continue;

      struct stat st;
      if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;
      absl::Time mtime = absl::TimeFromTimespec(st.st_mtim);
      if (now - mtime > window_) continue;

      known_[path] = now;
      found.push_back(PollCandidate{path, static_cast<int64_t>(st.st_size), mtime});
    }
    if (ec) VLOG(1) << "Could not list " << dir << ": " << ec.message();
  }

  if (!found.empty()) LOG(INFO) << "Poll found " << found.size() << " new file(s)";
  return found;
}

void DirectoryPoller::MarkKnown(std::string_view path, absl::Time now) {
  absl::MutexLock lock(&mu_);
  known_[std::string(path)] = now;
}

size_t DirectoryPoller::known_count() const {
  absl::ReaderMutexLock lock(&mu_);
  return known_.size();
}

void DirectoryPoller::ExpireKnown(absl::Time now) {
  const absl::Duration ttl = window_ * 2;
  absl::erase_if(known_, [&](const auto& entry) { return now - entry.second > ttl; });
}

}  // namespace dropin
