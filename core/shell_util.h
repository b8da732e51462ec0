#ifndef DROPIN_SHELL_UTIL_H_
#define DROPIN_SHELL_UTIL_H_

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "core/cancellation.h"

namespace dropin {

struct CommandResult {
  std::string stdout_out;
  std::string stderr_out;
  int exit_code;
};

struct CommandOptions {
  absl::Duration timeout = absl::InfiniteDuration();
  // 0 leaves stdout unbounded.
  size_t max_stdout_bytes = 0;
  std::shared_ptr<CancellationRequest> cancellation;
};

// Runs `command` through /bin/sh and captures both streams. stdout is kept byte for
// byte, so binary clipboard payloads survive.
// The child's process group is killed when the cancellation fires (Cancelled), the
// timeout elapses (DeadlineExceeded) or stdout grows past max_stdout_bytes
// (ResourceExhausted).
absl::StatusOr<CommandResult> RunCommand(std::string_view command, const CommandOptions& options = {});

// True if `program` resolves on PATH.
bool CommandExists(std::string_view program);

}  // namespace dropin

#endif  // DROPIN_SHELL_UTIL_H_
