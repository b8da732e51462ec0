#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "absl/strings/substitute.h"

#include "core/constants.h"
#include "core/ingest_config.h"
#include "core/ingestion_coordinator.h"
#include "core/terminal_input_scanner.h"
#include "interface/color.h"
#include "interface/command_definitions.h"
#include "interface/command_handler.h"
#include "interface/ui.h"

ABSL_FLAG(std::string, log, "", "Log file path");
ABSL_FLAG(int, max_attachments, dropin::kDefaultMaxAttachments, "Maximum number of attachments");
ABSL_FLAG(int, max_total_size_mb, static_cast<int>(dropin::kDefaultMaxTotalSizeBytes / dropin::kMiB),
          "Maximum combined attachment size in MiB");
ABSL_FLAG(int, max_file_size_mb, static_cast<int>(dropin::kDefaultMaxFileSizeBytes / dropin::kMiB),
          "Per-file ceiling in MiB for pasted and typed paths");
ABSL_FLAG(int, max_image_size_mb, static_cast<int>(dropin::kDefaultMaxImageSizeBytes / dropin::kMiB),
          "Per-image ceiling in MiB for pasted and typed paths");
ABSL_FLAG(int, max_drag_file_size_mb, static_cast<int>(dropin::kDefaultMaxDragFileSizeBytes / dropin::kMiB),
          "Per-file ceiling in MiB for dropped files");
ABSL_FLAG(std::string, scratch_dir, "",
          "Directory for owned temp files (overrides DROPIN_SCRATCH_DIR, default <tmp>/dropin-attachments)");
ABSL_FLAG(int, detection_window_ms, dropin::kDefaultDetectionWindowMs, "How long a drag gesture may collect files");
ABSL_FLAG(int, poll_interval_ms, dropin::kDefaultPollIntervalMs, "Watch directory poll interval (max 1000)");
ABSL_FLAG(std::string, watch_dirs, "", "Comma separated watch directories (overrides DROPIN_WATCH_DIRS)");
ABSL_FLAG(bool, disable_polling, false, "Do not poll watch directories in the background");
ABSL_FLAG(bool, disable_stability_check, false, "Ingest files without waiting for them to settle");
ABSL_FLAG(int, explicit_settle_ms, dropin::kDefaultExplicitSettleDelayMs,
          "How long a typed or pasted path must stay unchanged before it is read");
ABSL_FLAG(int, worker_threads, 2, "Threads that process dropped files");
ABSL_FLAG(bool, mouse_tracking, false, "Ask the terminal to report mouse drags (xterm SGR mode)");

std::string GetHelpText() {
  std::string help =
      "dropin - attach files to a terminal chat by drag, paste or path\n\n"
      "Usage:\n"
      "  dropin [options]\n\n"
      "Use --helpfull to see all available command-line flags.\n\n"
      "Slash commands:\n";

  std::map<std::string, std::vector<std::pair<std::string, std::string>>> category_rows;
  std::vector<std::string> categories;

  for (const auto& def : dropin::GetCommandDefinitions()) {
    if (std::find(categories.begin(), categories.end(), def.category) == categories.end()) {
      categories.push_back(def.category);
    }
    for (const auto& line : def.help_lines) {
      if (line.empty()) continue;
      if (line[0] == '/') {
        size_t sep = line.find("  ");
        if (sep != std::string::npos) {
          category_rows[def.category].emplace_back(line.substr(0, sep),
                                                   std::string(absl::StripLeadingAsciiWhitespace(line.substr(sep))));
        } else {
          category_rows[def.category].emplace_back(line, "");
        }
      } else {
        std::string name_part = def.name;
        for (const auto& alias : def.aliases) {
          name_part += ", " + alias;
        }
        category_rows[def.category].emplace_back(name_part, line);
      }
    }
  }

  for (const auto& cat : categories) {
    help += "\n  " + cat + "\n";
    for (const auto& row : category_rows[cat]) {
      std::string cmd = row.first;
      if (cmd.size() < 24) cmd.resize(24, ' ');
      help += absl::Substitute("    $0 $1\n", cmd, row.second);
    }
  }
  help += "\nAnything else you type or paste is scanned for file paths and file:// URIs.\n";
  return help;
}

void ShowHelp() { std::cout << GetHelpText() << std::endl; }

namespace {

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  // Send() is called from the poll thread and the workers as well.
  std::mutex mu_;
  std::ofstream stream_;
};

std::string FlagOrEnv(const std::string& flag_value, const char* env_name) {
  if (!flag_value.empty()) return flag_value;
  const char* env = std::getenv(env_name);
  return env ? env : "";
}

dropin::IngestConfig ConfigFromFlags() {
  dropin::IngestConfig config;
  config.max_attachments = absl::GetFlag(FLAGS_max_attachments);
  config.max_total_size_bytes = absl::GetFlag(FLAGS_max_total_size_mb) * dropin::kMiB;
  config.max_file_size_bytes = absl::GetFlag(FLAGS_max_file_size_mb) * dropin::kMiB;
  config.max_image_size_bytes = absl::GetFlag(FLAGS_max_image_size_mb) * dropin::kMiB;
  config.max_drag_file_size_bytes = absl::GetFlag(FLAGS_max_drag_file_size_mb) * dropin::kMiB;
  config.scratch_directory = FlagOrEnv(absl::GetFlag(FLAGS_scratch_dir), "DROPIN_SCRATCH_DIR");
  config.detection_window = absl::Milliseconds(absl::GetFlag(FLAGS_detection_window_ms));
  config.session_timeout = std::max(config.session_timeout, config.detection_window);
  config.poll_interval = absl::Milliseconds(absl::GetFlag(FLAGS_poll_interval_ms));
  config.enable_polling = !absl::GetFlag(FLAGS_disable_polling);
  config.enable_stability_check = !absl::GetFlag(FLAGS_disable_stability_check);
  config.explicit_settle_delay = absl::Milliseconds(absl::GetFlag(FLAGS_explicit_settle_ms));
  config.worker_threads = absl::GetFlag(FLAGS_worker_threads);

  std::string watch = FlagOrEnv(absl::GetFlag(FLAGS_watch_dirs), "DROPIN_WATCH_DIRS");
  for (absl::string_view dir : absl::StrSplit(watch, ',', absl::SkipWhitespace())) {
    config.watch_directories.emplace_back(absl::StripAsciiWhitespace(dir));
  }
  return config;
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(GetHelpText());
  absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<FileLogSink> log_sink;
  if (!log_path.empty()) {
    log_sink = std::make_unique<FileLogSink>(log_path);
    absl::AddLogSink(log_sink.get());
  }
  LOG(INFO) << "Logging initialized and sink added.";

  dropin::ConsoleObserver observer(std::cout);
  auto coordinator_or = dropin::IngestionCoordinator::Create(ConfigFromFlags(), &observer);
  if (!coordinator_or.ok()) {
    dropin::HandleStatus(coordinator_or.status(), "Configuration Error");
    return 1;
  }
  auto& coordinator = **coordinator_or;

  auto cmd_handler_or = dropin::CommandHandler::Create(&coordinator);
  if (!cmd_handler_or.ok()) {
    LOG(ERROR) << "Failed to create command handler: " << cmd_handler_or.status().message();
    return 1;
  }
  auto& cmd_handler = **cmd_handler_or;
  dropin::SetCompletionCommands(cmd_handler.GetCommandNames(), cmd_handler.GetSubCommandMap());

  dropin::InstallShutdownSignalHandlers();
  dropin::SetupTerminal();
  dropin::ShowBanner();
  dropin::HandleStatus(coordinator.StartDetection(), "Drag detection unavailable");
  std::cout << dropin::Colorize("dropin", "", ansi::Logo)
            << " - scratch: " << coordinator.config().scratch_directory << std::endl;

  const bool mouse_tracking = absl::GetFlag(FLAGS_mouse_tracking);
  if (mouse_tracking) std::cout << dropin::MouseTrackingSequence(true) << std::flush;

  while (true) {
    dropin::AttachmentStats stats = coordinator.Stats();
    std::string modeline = absl::StrCat("dropin<A:", stats.count, "/", coordinator.config().max_attachments,
                                        ", S:", dropin::FormatFileSize(stats.total_size), ">");

    std::string input = dropin::ReadLine(modeline);
    if (input.empty()) continue;

    auto res = cmd_handler.Handle(input, ShowHelp);
    if (res == dropin::CommandHandler::Result::EXIT) break;
    if (res == dropin::CommandHandler::Result::NOT_A_COMMAND) {
      coordinator.SubmitRawTerminalBytes(input);
      // readline hands over whole lines; nothing more of this one is coming.
      coordinator.FlushTerminalInput();
    }
  }

  if (mouse_tracking) std::cout << dropin::MouseTrackingSequence(false) << std::flush;
  LOG(INFO) << "Exiting" << (dropin::ShutdownRequested() ? " on signal" : "");
  coordinator.Shutdown();
  return 0;
}
