#ifndef DROPIN_DIRECTORY_POLLER_H_
#define DROPIN_DIRECTORY_POLLER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace dropin {

struct PollCandidate {
  std::string path;
  int64_t size_bytes = 0;
  absl::Time modified_at;
};

// Drop directories watched when none are configured: the system temp dir, the
// dedicated drop dir, <cwd>/temp, <cwd>/dropped-files, ~/Downloads, ~/Desktop.
std::vector<std::string> DefaultWatchDirectories();

/**
 * @brief True for names the poller must never pick up.
 *
 * Hidden files, this subsystem's own scratch names (13-digit millisecond
 * prefix, "dropin-"), other tools' temp naming (long hex prefixes, "claude-",
 * "cwd", "temp", "tmp") and implausible extensionless names (longer than 20
 * characters or shorter than 3).
 */
bool ShouldIgnoreFile(std::string_view filename);

/**
 * @brief Finds files that recently appeared in a set of drop directories.
 *
 * A regular file whose modification time falls inside the detection window and
 * that has not been reported before is returned once. Reported paths are
 * remembered for twice the window so a file is not offered again while it is
 * still "recent". Thread-safe.
 */
class DirectoryPoller {
 public:
  DirectoryPoller(std::vector<std::string> directories, absl::Duration detection_window,
                  std::string scratch_root = "");

  std::vector<PollCandidate> Poll(absl::Time now);

  // Marks `path` as already seen, e.g. when it arrived through another channel.
  void MarkKnown(std::string_view path, absl::Time now);

  size_t known_count() const;

 private:
  void ExpireKnown(absl::Time now) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mu_);

  const std::vector<std::string> directories_;
  const absl::Duration window_;
  const std::string scratch_root_;

  mutable absl::Mutex mu_;
  absl::flat_hash_map<std::string, absl::Time> known_ ABSL_GUARDED_BY(mu_);
};

}  // namespace dropin

#endif  // DROPIN_DIRECTORY_POLLER_H_
