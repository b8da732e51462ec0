#include "interface/command_handler.h"

#include <algorithm>
#include <filesystem>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "core/test_util.h"

namespace dropin {
namespace {

class FixedClipboard : public ClipboardProvider {
 public:
  explicit FixedClipboard(std::string text) : text_(std::move(text)) {}
  absl::StatusOr<std::string> ReadText() override { return text_; }
  absl::StatusOr<std::string> ReadImagePng() override { return absl::NotFoundError("no image"); }

 private:
  std::string text_;
};

class CommandHandlerTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    std::filesystem::create_directories(Path("watch"));
  }

  void MakeHandler(std::string clipboard = "") {
    IngestConfig config;
    config.scratch_directory = Path("scratch");
    config.watch_directories = {Path("watch")};
    config.enable_polling = false;
    config.explicit_settle_delay = absl::Milliseconds(10);
    auto coordinator_or = IngestionCoordinator::Create(config, nullptr, std::make_unique<FixedClipboard>(clipboard));
    ASSERT_TRUE(coordinator_or.ok()) << coordinator_or.status();
    coordinator_ = std::move(*coordinator_or);
    auto handler_or = CommandHandler::Create(coordinator_.get());
    ASSERT_TRUE(handler_or.ok());
    handler_ = std::move(*handler_or);
  }

  CommandHandler::Result Run(std::string input) { return handler_->Handle(input, [this]() { help_shown_ = true; }); }

  std::unique_ptr<IngestionCoordinator> coordinator_;
  std::unique_ptr<CommandHandler> handler_;
  bool help_shown_ = false;
};

TEST(CommandHandlerCreateTest, RejectsNullCoordinator) { EXPECT_FALSE(CommandHandler::Create(nullptr).ok()); }

TEST_F(CommandHandlerTest, DetectsCommandsAndAliases) {
  MakeHandler();
  EXPECT_EQ(Run("/help"), CommandHandler::Result::HANDLED);
  EXPECT_TRUE(help_shown_);
  EXPECT_EQ(Run("/quit"), CommandHandler::Result::EXIT);
  EXPECT_EQ(Run("/exit"), CommandHandler::Result::EXIT);
  EXPECT_EQ(Run("/bogus"), CommandHandler::Result::UNKNOWN);
  EXPECT_EQ(Run("hello there"), CommandHandler::Result::NOT_A_COMMAND);

  auto names = handler_->GetCommandNames();
  EXPECT_NE(std::find(names.begin(), names.end(), "/list"), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "/rm"), names.end());
  auto it = handler_->GetSubCommandMap().find("/drag");
  ASSERT_NE(it, handler_->GetSubCommandMap().end());
  EXPECT_NE(std::find(it->second.begin(), it->second.end(), "scan"), it->second.end());
}

TEST_F(CommandHandlerTest, DroppedAbsolutePathIsNotACommand) {
  MakeHandler();
  std::string file = WriteFile("shot.png", "x");
  EXPECT_EQ(Run(file), CommandHandler::Result::NOT_A_COMMAND);
  EXPECT_EQ(Run(absl::StrCat(file, " ")), CommandHandler::Result::NOT_A_COMMAND);
}

TEST_F(CommandHandlerTest, AttachListsAndRemoves) {
  MakeHandler();
  std::string a = WriteFile("a b.txt", "alpha");
  std::string b = WriteFile("b.txt", "beta");

  testing::internal::CaptureStdout();
  EXPECT_EQ(Run(absl::StrCat("/attach \"", a, "\" ", b)), CommandHandler::Result::HANDLED);
  std::string output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "a b.txt")) << output;
  EXPECT_EQ(coordinator_->Stats().count, 2);

  testing::internal::CaptureStdout();
  Run("/attachments");
  output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "att_1"));
  EXPECT_TRUE(absl::StrContains(output, "att_2"));

  testing::internal::CaptureStdout();
  Run("/rm att_1");
  output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "Removed a b.txt (att_1)")) << output;
  EXPECT_EQ(coordinator_->Stats().count, 1);
  EXPECT_FALSE(coordinator_->GetAttachment("att_1").has_value());
  EXPECT_TRUE(coordinator_->GetAttachment("att_2").has_value());

  testing::internal::CaptureStdout();
  Run("/clear");
  output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "Cleared 1"));
  EXPECT_EQ(coordinator_->Stats().count, 0);
}

TEST_F(CommandHandlerTest, JsonListingParses) {
  MakeHandler();
  ASSERT_TRUE(coordinator_->SubmitFilePath(WriteFile("a.txt", "abc")).ok());

  testing::internal::CaptureStdout();
  Run("/list --json");
  std::string output = testing::internal::GetCapturedStdout();
  auto j = nlohmann::json::parse(output, nullptr, false);
  ASSERT_FALSE(j.is_discarded()) << output;
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["filename"], "a.txt");
  EXPECT_EQ(j[0]["size"], 3);
}

TEST_F(CommandHandlerTest, RequestPartsCarryContent) {
  MakeHandler();
  ASSERT_TRUE(coordinator_->SubmitBuffer("hi!", "note.txt").ok());

  testing::internal::CaptureStdout();
  Run("/attachments --parts");
  std::string output = testing::internal::GetCapturedStdout();
  auto j = nlohmann::json::parse(output, nullptr, false);
  ASSERT_FALSE(j.is_discarded()) << output;
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["data"], "aGkh");
  EXPECT_EQ(j[0]["source"]["origin"], "upload");
}

TEST_F(CommandHandlerTest, PasteAttachesClipboardFiles) {
  std::string a = WriteFile("one.txt", "1");
  std::string b = WriteFile("two.txt", "2");
  MakeHandler(absl::StrCat(a, "\n", b));

  testing::internal::CaptureStdout();
  EXPECT_EQ(Run("/paste"), CommandHandler::Result::HANDLED);
  std::string output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "Pasted 2")) << output;
  EXPECT_EQ(coordinator_->Stats().count, 2);
}

TEST_F(CommandHandlerTest, StatsAndDragStatus) {
  MakeHandler();
  testing::internal::CaptureStdout();
  Run("/stats");
  Run("/drag status");
  std::string output = testing::internal::GetCapturedStdout();
  EXPECT_TRUE(absl::StrContains(output, "Attachments: 0/10")) << output;
  EXPECT_TRUE(absl::StrContains(output, Path("watch"))) << output;
  EXPECT_TRUE(absl::StrContains(output, "0 recent drop(s)")) << output;
}

}  // namespace
}  // namespace dropin
