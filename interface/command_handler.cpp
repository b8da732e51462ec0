#include "interface/command_handler.h"

#include <algorithm>
#include <optional>
#include <iostream>

#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "nlohmann/json.hpp"

#include "core/file_content_reader.h"
#include "core/path_heuristics.h"
#include "interface/command_definitions.h"
#include "interface/ui.h"

namespace dropin {

CommandHandler::CommandHandler(IngestionCoordinator* coordinator) : coordinator_(coordinator) { RegisterCommands(); }

void CommandHandler::RegisterCommands() {
  commands_["/help"] = [this](CommandArgs& args) { return HandleHelp(args); };
  commands_["/exit"] = [this](CommandArgs& args) { return HandleExit(args); };
  commands_["/attach"] = [this](CommandArgs& args) { return HandleAttach(args); };
  commands_["/paste"] = [this](CommandArgs& args) { return HandlePaste(args); };
  commands_["/attachments"] = [this](CommandArgs& args) { return HandleAttachments(args); };
  commands_["/remove"] = [this](CommandArgs& args) { return HandleRemove(args); };
  commands_["/clear"] = [this](CommandArgs& args) { return HandleClear(args); };
  commands_["/stats"] = [this](CommandArgs& args) { return HandleStats(args); };
  commands_["/drag"] = [this](CommandArgs& args) { return HandleDrag(args); };

  for (const auto& def : GetCommandDefinitions()) {
    auto it = commands_.find(def.name);
    if (it == commands_.end()) continue;
    auto handler = it->second;
    for (const auto& alias : def.aliases) {
      commands_[alias] = handler;
    }
    if (!def.sub_commands.empty()) {
      sub_commands_[def.name] = def.sub_commands;
    }
  }
}

std::vector<std::string> CommandHandler::GetCommandNames() const {
  std::vector<std::string> names;
  for (const auto& [name, _] : commands_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

CommandHandler::Result CommandHandler::Handle(std::string& input, std::function<void()> show_help_fn) {
  std::string trimmed = std::string(absl::StripAsciiWhitespace(input));
  // Dropped absolute paths start with '/' too; only a bare first word can be a command.
  if (trimmed.empty() || trimmed[0] != '/') return Result::NOT_A_COMMAND;

  std::vector<std::string> parts = absl::StrSplit(trimmed, absl::MaxSplits(' ', 1));
  std::string cmd = parts[0];
  std::string args_str = (parts.size() > 1) ? std::string(absl::StripAsciiWhitespace(parts[1])) : "";

  auto it = commands_.find(cmd);
  if (it != commands_.end()) {
    CommandArgs args{input, std::move(show_help_fn), args_str};
    return it->second(args);
  }
  if (cmd.find('/', 1) != std::string::npos || IsRegularFile(cmd)) return Result::NOT_A_COMMAND;

  std::cerr << "Unknown command: " << cmd << std::endl;
  return Result::UNKNOWN;
}

CommandHandler::Result CommandHandler::HandleHelp(CommandArgs& args) {
  if (args.show_help_fn) args.show_help_fn();
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleExit([[maybe_unused]] CommandArgs& args) { return Result::EXIT; }

CommandHandler::Result CommandHandler::HandleAttach(CommandArgs& args) {
  std::vector<std::string> paths = SplitShellWords(args.args);
  if (paths.empty()) {
    std::cerr << "Usage: /attach <path>..." << std::endl;
    return Result::HANDLED;
  }
  for (const std::string& path : paths) {
    auto att = coordinator_->SubmitFilePath(path);
    if (att.ok()) {
      std::cout << icons::Success << " " << att->id << "  " << att->filename << " ("
                << FormatFileSize(att->size_bytes) << ")" << std::endl;
    } else {
      HandleStatus(att.status(), path);
    }
  }
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandlePaste([[maybe_unused]] CommandArgs& args) {
  PasteOutcome outcome = coordinator_->Paste();
  for (const absl::Status& rejection : outcome.rejections) {
    HandleStatus(rejection, "Paste");
  }
  if (outcome.type == ClipboardContent::Type::kText) {
    std::cout << icons::Clipboard << " Clipboard holds no file or image";
    if (!outcome.text.empty()) std::cout << " (" << outcome.text.size() << " characters of text)";
    std::cout << std::endl;
    return Result::HANDLED;
  }
  std::cout << icons::Clipboard << " Pasted " << outcome.attachments.size() << " attachment(s)" << std::endl;
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleAttachments(CommandArgs& args) {
  std::vector<Attachment> attachments = coordinator_->ListAttachments();
  if (args.args == "--json") {
    nlohmann::json j = nlohmann::json::array();
    for (const Attachment& a : attachments) j.push_back(a);
    std::cout << j.dump(2) << std::endl;
    return Result::HANDLED;
  }
  if (args.args == "--parts") {
    nlohmann::json parts = nlohmann::json::array();
    for (const Attachment& a : attachments) {
      auto part = ToRequestPart(a);
      if (!part.ok()) {
        HandleStatus(part.status(), a.filename);
        continue;
      }
      parts.push_back(*std::move(part));
    }
    std::cout << parts.dump(2) << std::endl;
    return Result::HANDLED;
  }
  if (!args.args.empty()) {
    std::cerr << "Usage: /attachments [--json|--parts]" << std::endl;
    return Result::HANDLED;
  }
  std::cout << FormatAttachmentList(attachments) << std::endl;
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleRemove(CommandArgs& args) {
  if (args.args.empty()) {
    std::cerr << "Usage: /remove <id>" << std::endl;
    return Result::HANDLED;
  }
  std::optional<Attachment> attachment = coordinator_->GetAttachment(args.args);
  absl::Status status = coordinator_->RemoveAttachment(args.args);
  if (!status.ok()) {
    HandleStatus(status, "Remove");
    return Result::HANDLED;
  }
  std::cout << "Removed " << (attachment ? attachment->filename : args.args) << " (" << args.args << ")" << std::endl;
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleClear([[maybe_unused]] CommandArgs& args) {
  int removed = coordinator_->ClearAttachments();
  std::cout << "Cleared " << removed << " attachment(s)" << std::endl;
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleStats([[maybe_unused]] CommandArgs& args) {
  const IngestConfig& config = coordinator_->config();
  std::cout << FormatStats(coordinator_->Stats(), config.max_attachments, config.max_total_size_bytes,
                           coordinator_->DetectionStats())
            << std::endl;
  return Result::HANDLED;
}

CommandHandler::Result CommandHandler::HandleDrag(CommandArgs& args) {
  if (args.args.empty() || args.args == "status") {
    DragEngineStats stats = coordinator_->DetectionStats();
    std::cout << "Drag detection " << (stats.active ? "running" : "stopped");
    if (stats.dragging) std::cout << ", drag in progress (" << stats.session_id << ")";
    std::cout << ", " << stats.open_sessions << " open session(s), " << coordinator_->RecentDropCount()
              << " recent drop(s)" << std::endl;
    for (const std::string& dir : coordinator_->config().watch_directories) {
      std::cout << "  watching " << dir << std::endl;
    }
    return Result::HANDLED;
  }
  if (args.args == "scan") {
    coordinator_->ScanWatchDirectories();
    std::cout << "Scanned " << coordinator_->config().watch_directories.size() << " watch director(ies)"
              << std::endl;
    return Result::HANDLED;
  }
  std::cerr << "Unknown /drag subcommand: " << args.args << std::endl;
  return Result::HANDLED;
}

}  // namespace dropin
