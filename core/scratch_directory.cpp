#include "core/scratch_directory.h"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "core/file_content_reader.h"
#include "core/ingest_error.h"
#include "core/status_macros.h"

namespace dropin {

namespace fs = std::filesystem;

std::string SanitizeFilename(std::string_view filename) {
  std::string base = fs::path(std::string(filename)).filename().string();
  std::string out;
  out.reserve(base.size());
  for (char c : base) {
    if (c == '/' || c == '\\' || c == '\0' || static_cast<unsigned char>(c) < 0x20) {
      out += '_';
    } else {
      out += c;
    }
  }
  while (!out.empty() && out.front() == '.') out.erase(out.begin());
  if (out.empty()) out = "attachment";
  return out;
}

ScratchDirectory::ScratchDirectory(std::string root) : root_(ResolvePath(root)) {}

absl::Status ScratchDirectory::Ensure() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    return IngestError(IngestErrorKind::kIoFailure,
                       absl::StrCat("Could not create scratch directory ", root_, ": ", ec.message()));
  }
  return absl::OkStatus();
}

std::string ScratchDirectory::NextPath(std::string_view filename) {
  std::string name = SanitizeFilename(filename);
  int64_t stamp = absl::ToUnixMillis(absl::Now());
  int collision = 0;
  {
    absl::MutexLock lock(&mu_);
    if (stamp <= last_stamp_) {
      stamp = last_stamp_;
      collision = ++collision_;
    } else {
      last_stamp_ = stamp;
      collision_ = 0;
    }
  }
  std::string leaf = collision == 0 ? absl::StrCat(stamp, "-", name) : absl::StrCat(stamp, "-", collision, "-", name);
  return (fs::path(root_) / leaf).string();
}

absl::StatusOr<std::string> ScratchDirectory::Materialize(std::string_view bytes, std::string_view filename) {
  RETURN_IF_ERROR(Ensure());
  std::string path = NextPath(filename);

  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return IngestError(IngestErrorKind::kIoFailure, absl::StrCat("Could not create temp file ", path));
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if (out.fail()) {
    std::error_code ec;
    fs::remove(path, ec);
    return IngestError(IngestErrorKind::kIoFailure, absl::StrCat("Could not write temp file ", path));
  }
  VLOG(1) << "Materialized " << bytes.size() << " bytes at " << path;
  return path;
}

bool ScratchDirectory::Owns(std::string_view path) const {
  std::string resolved = ResolvePath(path);
  if (resolved.size() <= root_.size()) return false;
  return absl::StartsWith(resolved, root_) && resolved[root_.size()] == '/';
}

absl::Status ScratchDirectory::Remove(std::string_view path) {
  if (!Owns(path)) {
    return absl::PermissionDeniedError(absl::StrCat("Refusing to delete outside ", root_, ": ", path));
  }
  std::error_code ec;
  if (!fs::remove(ResolvePath(path), ec)) {
    if (ec) {
      return IngestError(IngestErrorKind::kIoFailure, absl::StrCat("Could not remove ", path, ": ", ec.message()));
    }
    return IngestError(IngestErrorKind::kNotFound, absl::StrCat("Temp file already gone: ", path));
  }
  return absl::OkStatus();
}

int ScratchDirectory::Sweep() {
  std::error_code ec;
  if (!fs::is_directory(root_, ec)) return 0;

  int removed = 0;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    std::error_code rm_ec;
    if (it->is_regular_file(rm_ec) && fs::remove(it->path(), rm_ec)) {
      removed++;
    } else if (rm_ec) {
      LOG(WARNING) << "Could not remove leftover " << it->path() << ": " << rm_ec.message();
    }
  }
  if (ec) LOG(WARNING) << "Scratch sweep of " << root_ << " stopped early: " << ec.message();

  if (fs::is_empty(root_, ec) && !ec) {
    fs::remove(root_, ec);
    if (ec) LOG(WARNING) << "Could not remove scratch directory " << root_ << ": " << ec.message();
  }
  if (removed > 0) LOG(INFO) << "Swept " << removed << " leftover file(s) from " << root_;
  return removed;
}

}  // namespace dropin
