#include "core/shell_util.h"

#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

namespace dropin {

namespace {

constexpr int kPollSliceMs = 50;
constexpr absl::Duration kTerminateGrace = absl::Milliseconds(50);

void CloseFd(int& fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

// A forked `sh -c` with its stdout and stderr read ends. Reaps the child on
// destruction if nobody waited for it.
class ChildProcess {
 public:
  static absl::StatusOr<std::unique_ptr<ChildProcess>> Spawn(const std::string& command) {
    int out[2];
    int err[2];
    if (pipe(out) == -1) return absl::InternalError("Failed to create stdout pipe");
    if (pipe(err) == -1) {
      close(out[0]);
      close(out[1]);
      return absl::InternalError("Failed to create stderr pipe");
    }

    pid_t pid = fork();
    if (pid == -1) {
      for (int fd : {out[0], out[1], err[0], err[1]}) close(fd);
      return absl::InternalError("Failed to fork");
    }
    if (pid == 0) {
      // New process group, so Kill() reaches helpers the shell spawns.
      setpgid(0, 0);
      dup2(out[1], STDOUT_FILENO);
      dup2(err[1], STDERR_FILENO);
      for (int fd : {out[0], out[1], err[0], err[1]}) close(fd);
      execl("/bin/sh", "sh", "-c", command.c_str(), nullptr);
      _exit(127);
    }

    close(out[1]);
    close(err[1]);
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, out[0], err[0]));
  }

  ~ChildProcess() {
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
    if (!reaped_) Kill();
  }

  int& stdout_fd() { return stdout_fd_; }
  int& stderr_fd() { return stderr_fd_; }

  void Kill() {
    if (reaped_) return;
    kill(-pid_, SIGTERM);
    absl::SleepFor(kTerminateGrace);
    int status;
    if (waitpid(pid_, &status, WNOHANG) == 0) {
      kill(-pid_, SIGKILL);
      waitpid(pid_, &status, 0);
    }
    reaped_ = true;
  }

  int Wait() {
    int status = 0;
    while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
  }

 private:
  ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
      : pid_(pid), stdout_fd_(stdout_fd), stderr_fd_(stderr_fd) {}

  pid_t pid_;
  int stdout_fd_;
  int stderr_fd_;
  bool reaped_ = false;
};

// Appends what is readable on `fd` to `sink`. Closes the fd on EOF or error.
void DrainReady(int& fd, short revents, std::string& sink) {
  if (fd < 0) return;
  if (revents & (POLLIN | POLLHUP)) {
    std::array<char, 4096> buffer;
    ssize_t n = read(fd, buffer.data(), buffer.size());
    if (n > 0) {
      sink.append(buffer.data(), static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
      CloseFd(fd);
    }
  } else if (revents & (POLLERR | POLLNVAL)) {
    CloseFd(fd);
  }
}

}  // namespace

absl::StatusOr<CommandResult> RunCommand(std::string_view command, const CommandOptions& options) {
  VLOG(1) << "Running command: " << command;
  auto child_or = ChildProcess::Spawn(std::string(command));
  if (!child_or.ok()) return child_or.status();
  std::unique_ptr<ChildProcess> child = *std::move(child_or);

  CommandResult result{"", "", -1};
  const absl::Time deadline = absl::Now() + options.timeout;

  while (child->stdout_fd() >= 0 || child->stderr_fd() >= 0) {
    if (options.cancellation != nullptr && options.cancellation->IsCancelled()) {
      child->Kill();
      return absl::CancelledError(absl::StrCat("Command cancelled: ", command));
    }
    if (absl::Now() > deadline) {
      LOG(WARNING) << "Command timed out after " << options.timeout << ": " << command;
      child->Kill();
      return absl::DeadlineExceededError(absl::StrCat("Command timed out: ", command));
    }

    std::array<pollfd, 2> fds{};
    fds[0] = {child->stdout_fd(), POLLIN, 0};
    fds[1] = {child->stderr_fd(), POLLIN, 0};
    int ready = poll(fds.data(), fds.size(), kPollSliceMs);
    if (ready == -1) {
      if (errno == EINTR) continue;
      child->Kill();
      return absl::InternalError(absl::StrCat("poll failed while running: ", command));
    }
    if (ready == 0) continue;

    DrainReady(child->stdout_fd(), fds[0].revents, result.stdout_out);
    DrainReady(child->stderr_fd(), fds[1].revents, result.stderr_out);

    if (options.max_stdout_bytes > 0 && result.stdout_out.size() > options.max_stdout_bytes) {
      child->Kill();
      return absl::ResourceExhaustedError(
          absl::StrCat("Output of '", command, "' exceeds ", options.max_stdout_bytes, " bytes"));
    }
  }

  result.exit_code = child->Wait();
  VLOG(1) << "Command exited with code " << result.exit_code;
  return result;
}

bool CommandExists(std::string_view program) {
  CommandOptions options;
  options.timeout = absl::Seconds(2);
  auto res = RunCommand(absl::StrCat("command -v ", program, " >/dev/null 2>&1"), options);
  return res.ok() && res->exit_code == 0;
}

}  // namespace dropin
