#include "interface/ui.h"

#include <signal.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

#include "core/ingest_error.h"
#include "readline/history.h"
#include "readline/readline.h"

namespace dropin {

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void OnShutdownSignal(int) { g_shutdown_requested = 1; }

// Runs inside readline after an interrupted read.
int StopReadingOnShutdown() {
  if (g_shutdown_requested) rl_done = 1;
  return 0;
}

/**
 * @brief Prints a horizontal separator line to the terminal.
 *
 * @param width The width of the line. If 0, uses the current terminal width.
 * @param color_fg The ANSI color code for the line.
 * @param header Optional label shown at the start of the rule.
 */
void PrintHorizontalLine(size_t width, const char* color_fg = ansi::Metadata, const std::string& header = "") {
  if (width == 0) width = GetTerminalWidth();
  std::string bold_fg = std::string(ansi::Bold) + color_fg;
  std::string label = header.empty() ? "" : "[ " + header + " ] ";
  size_t used = VisibleLength(label);
  std::string fill = width > used ? std::string(width - used, '-') : "";
  std::cout << Colorize(label + fill, "", bold_fg.c_str()) << std::endl;
}

std::vector<std::string> g_completion_commands;
absl::flat_hash_map<std::string, std::vector<std::string>> g_sub_commands;
std::vector<std::string> g_active_completion_list;

char* CommandGenerator(const char* text, int state) {
  static size_t list_index;
  if (!state) list_index = 0;

  while (list_index < g_active_completion_list.size()) {
    const std::string& candidate = g_active_completion_list[list_index++];
    if (absl::StartsWith(candidate, text)) return strdup(candidate.c_str());
  }
  return nullptr;
}

char** CommandCompletionProvider(const char* text, int start, [[maybe_unused]] int end) {
  if (start == 0 && text[0] == '/') {
    g_active_completion_list = g_completion_commands;
    return rl_completion_matches(text, CommandGenerator);
  }
  if (start > 0) {
    std::string line(rl_line_buffer);
    std::vector<std::string> parts = absl::StrSplit(line, absl::MaxSplits(' ', 1));
    auto it = g_sub_commands.find(parts[0]);
    if (it != g_sub_commands.end()) {
      g_active_completion_list = it->second;
      return rl_completion_matches(text, CommandGenerator);
    }
  }
  // Fall back to readline's filename completion for /attach and plain input.
  return nullptr;
}

std::string KindIcon(AttachmentKind kind) { return kind == AttachmentKind::kImage ? icons::Image : icons::File; }

}  // namespace

size_t GetTerminalWidth() {
  struct winsize w;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
    return w.ws_col > 0 ? w.ws_col : 80;
  }
  return 80;
}

void SetupTerminal() {
  // Leave application cursor and keypad modes so scrolling is not reported as keys.
  std::cout << "\033[?1l\033>" << std::flush;
}

void SetCompletionCommands(const std::vector<std::string>& commands,
                           const absl::flat_hash_map<std::string, std::vector<std::string>>& sub_commands) {
  g_completion_commands = commands;
  g_sub_commands = sub_commands;
  rl_attempted_completion_function = CommandCompletionProvider;
  rl_basic_word_break_characters = const_cast<char*>(" \t\n\"\\'`@$><=;|&{(");
}

void ShowBanner() {
  std::cout << Colorize(R"(     _                 _       )", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"(  __| |_ __ ___  _ __ (_)_ __  )", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"( / _` | '__/ _ \| '_ \| | '_ \ )", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"(| (_| | | | (_) | |_) | | | | |)", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"( \__,_|_|  \___/| .__/|_|_| |_|)", "", ansi::Logo) << std::endl;
  std::cout << Colorize(R"(                |_|            )", "", ansi::Logo) << std::endl;
  std::cout << std::endl;
#ifdef DROPIN_VERSION
  std::cout << " dropin version " << DROPIN_VERSION << std::endl;
#endif
  std::cout << " Drag files onto the terminal, paste them, or type /attach <path>." << std::endl;
  std::cout << " Type /help for a list of commands." << std::endl;
  std::cout << std::endl;
}

void InstallShutdownSignalHandlers() {
  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = OnShutdownSignal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART, so a blocked read returns and readline runs the event hook.
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
  rl_signal_event_hook = StopReadingOnShutdown;
}

bool ShutdownRequested() { return g_shutdown_requested != 0; }

std::string ReadLine(const std::string& modeline) {
  if (ShutdownRequested()) return "/exit";
  SetupTerminal();
  PrintHorizontalLine(0, ansi::Grey, modeline);
  char* buf = readline("> ");
  if (!buf) return "/exit";
  std::string line(buf);
  free(buf);
  if (ShutdownRequested()) return "/exit";
  if (!line.empty()) {
    add_history(line.c_str());
  }
  return line;
}

std::string FormatFileSize(int64_t bytes) {
  if (bytes < 1024) return absl::StrCat(bytes, " B");
  double value = static_cast<double>(bytes) / 1024.0;
  if (value < 1024.0) return absl::StrFormat("%.1f KB", value);
  value /= 1024.0;
  if (value < 1024.0) return absl::StrFormat("%.1f MB", value);
  return absl::StrFormat("%.1f GB", value / 1024.0);
}

std::string FormatAttachmentList(const std::vector<Attachment>& attachments) {
  if (attachments.empty()) return "No attachments. Drop or paste a file, or use /attach <path>.";

  std::string out;
  for (const Attachment& a : attachments) {
    if (!out.empty()) out += "\n";
    absl::StrAppend(&out, KindIcon(a.kind), " ", Colorize(a.id, "", ansi::Bold), "  ", a.filename, "  ",
                    Colorize(absl::StrCat(FormatFileSize(a.size_bytes), ", ", a.mime_type, ", ",
                                          OriginName(a.source.origin)),
                             "", ansi::Metadata));
  }
  return out;
}

std::string FormatStats(const AttachmentStats& stats, int max_attachments, int64_t max_total_size_bytes,
                        const DragEngineStats& detection) {
  std::string out = absl::StrFormat("Attachments: %d/%d (%d files, %d images, %d in scratch)\n", stats.count,
                                    max_attachments, stats.file_count, stats.image_count, stats.temp_file_count);
  absl::StrAppend(&out, "Total size:  ", FormatFileSize(stats.total_size), " of ",
                  FormatFileSize(max_total_size_bytes), "\n");
  absl::StrAppend(&out, "Detection:   ", detection.active ? "running" : "stopped");
  if (detection.dragging) absl::StrAppend(&out, ", drag in progress (", detection.session_id, ")");
  absl::StrAppend(&out, ", ", detection.open_sessions, " open session(s), ", detection.known_files, " known file(s)");
  return out;
}

std::string FormatRejection(const absl::Status& status) {
  auto kind = GetIngestErrorKind(status);
  if (!kind.has_value()) return std::string(status.message());
  return absl::StrCat("[", IngestErrorKindName(*kind), "] ", status.message());
}

void HandleStatus(const absl::Status& status, const std::string& context) {
  if (status.ok()) return;

  std::string msg = FormatRejection(status);
  if (size_t first_nl = msg.find('\n'); first_nl != std::string::npos) {
    msg = msg.substr(0, first_nl) + " (multi-line)...";
  }
  if (msg.length() > 160) {
    msg = msg.substr(0, 157) + "...";
  }

  if (!context.empty()) {
    std::cerr << icons::Error << " " << context << ": " << msg << std::endl;
    LOG(WARNING) << context << ": " << msg;
  } else {
    std::cerr << icons::Error << " " << msg << std::endl;
    LOG(WARNING) << msg;
  }
}

ConsoleObserver::ConsoleObserver(std::ostream& out) : out_(&out) {}

void ConsoleObserver::Print(const std::string& line) {
  absl::MutexLock lock(&mu_);
  *out_ << line << std::endl;
}

void ConsoleObserver::OnAttachmentAdded(const Attachment& attachment) {
  Print(absl::StrCat(icons::Success, " ", Colorize(absl::StrCat("Attached ", attachment.filename), "", ansi::Added),
                     " (", attachment.id, ", ", FormatFileSize(attachment.size_bytes), ")"));
}

void ConsoleObserver::OnAttachmentRemoved(const Attachment& attachment) {
  Print(absl::StrCat(icons::Trash, " Removed ", attachment.filename, " (", attachment.id, ")"));
}

void ConsoleObserver::OnDragSessionStarted(const DetectionSession& session) {
  Print(Colorize(absl::StrCat(icons::Drop, " Drop detected, collecting files..."), "", ansi::Metadata));
}

void ConsoleObserver::OnDragSessionProgress(const DetectionSession& session, std::string_view message) {
  Print(Colorize(absl::StrCat("   ", message), "", ansi::Metadata));
}

void ConsoleObserver::OnDragSessionCompleted(const DetectionSession& session, const std::vector<Attachment>& added) {
  if (added.empty()) {
    Print(absl::StrCat(icons::Warning, " Drop finished without new attachments"));
    return;
  }
  Print(absl::StrCat(icons::Drop, " Drop finished: ", added.size(), " file(s) attached"));
}

void ConsoleObserver::OnDragSessionError(const DetectionSession& session, const absl::Status& status) {
  Print(absl::StrCat(icons::Warning, " ", Colorize(FormatRejection(status), "", ansi::Rejected)));
}

}  // namespace dropin
