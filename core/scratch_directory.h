#ifndef DROPIN_SCRATCH_DIRECTORY_H_
#define DROPIN_SCRATCH_DIRECTORY_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

namespace dropin {

/**
 * @brief The temp directory this subsystem owns.
 *
 * Every materialized buffer and every copied-in drag file lives here as
 * `<unix-millis>-<filename>`. Nothing outside the directory is ever deleted
 * through this class.
 */
class ScratchDirectory {
 public:
  explicit ScratchDirectory(std::string root);

  ScratchDirectory(const ScratchDirectory&) = delete;
  ScratchDirectory& operator=(const ScratchDirectory&) = delete;

  // Creates the directory (and parents) if missing.
  absl::Status Ensure();

  // Writes `bytes` to a fresh file named after `filename`. Returns its path.
  absl::StatusOr<std::string> Materialize(std::string_view bytes, std::string_view filename);

  // Unlinks `path`. Paths outside the root are refused with PermissionDenied.
  absl::Status Remove(std::string_view path);

  // Removes every file left in the root, then the root itself if it ends up
  // empty. Returns the number of files removed. Failures are logged.
  int Sweep();

  // True if `path` lies inside the root.
  bool Owns(std::string_view path) const;

  const std::string& root() const { return root_; }

 private:
  // Reserves a path that no other call has handed out.
  std::string NextPath(std::string_view filename);

  const std::string root_;

  absl::Mutex mu_;
  int64_t last_stamp_ ABSL_GUARDED_BY(mu_) = 0;
  int collision_ ABSL_GUARDED_BY(mu_) = 0;
};

// Reduces `filename` to a safe basename: no separators, no leading dots, never empty.
std::string SanitizeFilename(std::string_view filename);

}  // namespace dropin

#endif  // DROPIN_SCRATCH_DIRECTORY_H_
