#ifndef DROPIN_COMMAND_HANDLER_H_
#define DROPIN_COMMAND_HANDLER_H_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"

#include "core/ingestion_coordinator.h"

namespace dropin {

class CommandHandler {
 public:
  enum class Result {
    HANDLED,        // Command executed
    NOT_A_COMMAND,  // Plain input, goes to drag detection
    UNKNOWN,        // Starts with /, but unrecognized
    EXIT,           // /exit or /quit
  };

  struct CommandArgs {
    std::string& input;
    std::function<void()> show_help_fn;
    std::string args;
  };

  using CommandFunc = std::function<Result(CommandArgs&)>;

  static absl::StatusOr<std::unique_ptr<CommandHandler>> Create(IngestionCoordinator* coordinator) {
    if (coordinator == nullptr) {
      return absl::InvalidArgumentError("IngestionCoordinator cannot be null");
    }
    return std::unique_ptr<CommandHandler>(new CommandHandler(coordinator));
  }

  Result Handle(std::string& input, std::function<void()> show_help_fn);

  std::vector<std::string> GetCommandNames() const;
  const absl::flat_hash_map<std::string, std::vector<std::string>>& GetSubCommandMap() const { return sub_commands_; }

 private:
  explicit CommandHandler(IngestionCoordinator* coordinator);

  void RegisterCommands();

  Result HandleHelp(CommandArgs& args);
  Result HandleExit(CommandArgs& args);
  Result HandleAttach(CommandArgs& args);
  Result HandlePaste(CommandArgs& args);
  Result HandleAttachments(CommandArgs& args);
  Result HandleRemove(CommandArgs& args);
  Result HandleClear(CommandArgs& args);
  Result HandleStats(CommandArgs& args);
  Result HandleDrag(CommandArgs& args);

  IngestionCoordinator* coordinator_;
  absl::flat_hash_map<std::string, CommandFunc> commands_;
  absl::flat_hash_map<std::string, std::vector<std::string>> sub_commands_;
};

}  // namespace dropin

#endif  // DROPIN_COMMAND_HANDLER_H_
