#include "core/ingestion_coordinator.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"

#include "core/ingest_error.h"
#include "core/test_util.h"

namespace dropin {
namespace {

namespace fs = std::filesystem;

class FakeClipboardProvider : public ClipboardProvider {
 public:
  explicit FakeClipboardProvider(std::string text) : text_(std::move(text)) {}
  absl::StatusOr<std::string> ReadText() override { return text_; }
  absl::StatusOr<std::string> ReadImagePng() override { return absl::NotFoundError("no image"); }

 private:
  std::string text_;
};

class RecordingObserver : public IngestObserver {
 public:
  void OnAttachmentAdded(const Attachment& attachment) override {
    absl::MutexLock lock(&mu_);
    added.push_back(attachment.id);
  }
  void OnDragSessionProgress(const DetectionSession& session, std::string_view message) override {
    absl::MutexLock lock(&mu_);
    progress.push_back(std::string(message));
  }
  void OnDragSessionCompleted(const DetectionSession& session, const std::vector<Attachment>& attachments) override {
    absl::MutexLock lock(&mu_);
    completed.push_back(static_cast<int>(attachments.size()));
    completed_status.push_back(session.status);
  }

  absl::Mutex mu_;
  std::vector<std::string> added;
  std::vector<std::string> progress;
  std::vector<int> completed;
  std::vector<SessionStatus> completed_status;
};

class IngestionCoordinatorTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    fs::create_directories(Path("watch"));
    config_.scratch_directory = Path("scratch");
    config_.watch_directories = {Path("watch")};
    config_.enable_polling = false;
    config_.stability.settle_delay = absl::Milliseconds(10);
    config_.stability.max_delay = absl::Milliseconds(40);
    config_.explicit_settle_delay = absl::Milliseconds(10);
  }

  // Appends 1 KiB chunks to `path` every 5ms on a background thread. Returns
  // once the first chunk is on disk.
  std::thread StartSlowWriter(const std::string& path, int chunks) {
    std::ofstream(path, std::ios::binary) << std::string(1024, 'a');
    return std::thread([path, chunks] {
      for (int i = 1; i < chunks; ++i) {
        absl::SleepFor(absl::Milliseconds(5));
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << std::string(1024, 'b');
      }
    });
  }

  // Slow enough for the writer above to be caught mid-write.
  void UseSlowSettling() {
    config_.stability.settle_delay = absl::Milliseconds(50);
    config_.explicit_settle_delay = absl::Milliseconds(50);
    config_.stability.max_delay = absl::Milliseconds(100);
    config_.stability.max_retries = 6;
  }

  std::unique_ptr<IngestionCoordinator> Make(std::string clipboard_text = "") {
    auto coordinator =
        IngestionCoordinator::Create(config_, &observer_, std::make_unique<FakeClipboardProvider>(clipboard_text));
    EXPECT_TRUE(coordinator.ok()) << coordinator.status();
    return *std::move(coordinator);
  }

  IngestConfig config_;
  RecordingObserver observer_;
};

TEST_F(IngestionCoordinatorTest, RejectsInvalidConfig) {
  config_.max_attachments = 0;
  auto coordinator = IngestionCoordinator::Create(config_);
  EXPECT_EQ(coordinator.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(IngestionCoordinatorTest, FilePathKeepsBytesInMemory) {
  std::string file = WriteFile("notes.txt", "hello");
  auto coordinator = Make();

  auto att = coordinator->SubmitFilePath(file);
  ASSERT_TRUE(att.ok()) << att.status();
  EXPECT_EQ(att->filename, "notes.txt");
  EXPECT_EQ(att->bytes, "hello");
  EXPECT_FALSE(att->is_temp_file());
  EXPECT_EQ(att->source.origin, Origin::kFileReference);
  EXPECT_EQ(att->source.original_path.value_or(""), file);
  EXPECT_EQ(observer_.added.size(), 1u);
}

TEST_F(IngestionCoordinatorTest, QuotaStopsThirdFile) {
  config_.max_attachments = 2;
  auto coordinator = Make();

  ASSERT_TRUE(coordinator->SubmitFilePath(WriteFile("a.txt", "a")).ok());
  ASSERT_TRUE(coordinator->SubmitFilePath(WriteFile("b.txt", "b")).ok());
  auto third = coordinator->SubmitFilePath(WriteFile("c.txt", "c"));
  EXPECT_TRUE(IsIngestError(third.status(), IngestErrorKind::kQuotaExceeded)) << third.status();
  EXPECT_EQ(coordinator->Stats().count, 2);
}

TEST_F(IngestionCoordinatorTest, MissingAndDirectoryPathsAreRejected) {
  auto coordinator = Make();
  EXPECT_TRUE(IsIngestError(coordinator->SubmitFilePath(Path("gone.txt")).status(), IngestErrorKind::kNotFound));
  EXPECT_TRUE(IsIngestError(coordinator->SubmitFilePath(Path("watch")).status(), IngestErrorKind::kNotAFile));
  EXPECT_EQ(coordinator->Stats().count, 0);
}

TEST_F(IngestionCoordinatorTest, SamePathIsRegisteredOnce) {
  std::string file = WriteFile("notes.txt", "hello");
  auto coordinator = Make();
  ASSERT_TRUE(coordinator->SubmitFilePath(file).ok());
  auto again = coordinator->SubmitFilePath(file);
  EXPECT_TRUE(IsIngestError(again.status(), IngestErrorKind::kAlreadyRegistered));
}

TEST_F(IngestionCoordinatorTest, ConcurrentSubmitsOfOnePathYieldOneAttachment) {
  std::string file = WriteFile("notes.txt", std::string(64 * 1024, 'x'));
  auto coordinator = Make();

  std::atomic<int> ok{0};
  std::atomic<int> duplicate{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      auto result = coordinator->SubmitFilePath(file);
      if (result.ok()) {
        ok++;
      } else if (IsIngestError(result.status(), IngestErrorKind::kAlreadyRegistered)) {
        duplicate++;
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), 1);
  EXPECT_EQ(duplicate.load(), 7);
  EXPECT_EQ(coordinator->ListAttachments().size(), 1u);
}

TEST_F(IngestionCoordinatorTest, SubmitBufferMaterializesScratchFile) {
  auto coordinator = Make();
  auto att = coordinator->SubmitBuffer("col1,col2\n", "data.csv");
  ASSERT_TRUE(att.ok()) << att.status();
  ASSERT_TRUE(att->is_temp_file());
  EXPECT_TRUE(att->bytes.empty());
  EXPECT_EQ(att->source.origin, Origin::kUpload);
  EXPECT_EQ(fs::file_size(*att->temp_path), 10u);

  ASSERT_TRUE(coordinator->RemoveAttachment(att->id).ok());
  EXPECT_FALSE(fs::exists(*att->temp_path));
}

TEST_F(IngestionCoordinatorTest, SubmitBufferOverCeilingLeavesNoFile) {
  config_.max_file_size_bytes = 4;
  auto coordinator = Make();
  auto att = coordinator->SubmitBuffer("too many bytes", "big.txt");
  EXPECT_TRUE(IsIngestError(att.status(), IngestErrorKind::kTooLarge));
  EXPECT_TRUE(!fs::exists(Path("scratch")) || fs::is_empty(Path("scratch")));
}

TEST_F(IngestionCoordinatorTest, PasteOfTwoPathsAttachesBoth) {
  std::string a = WriteFile("a.txt", "a");
  std::string b = WriteFile("b.txt", "b");
  auto coordinator = Make(absl::StrCat(a, "\n", b, "\n"));

  PasteOutcome outcome = coordinator->Paste();
  EXPECT_EQ(outcome.type, ClipboardContent::Type::kFiles);
  EXPECT_EQ(outcome.attachments.size(), 2u);
  EXPECT_TRUE(outcome.rejections.empty());
  for (const Attachment& att : outcome.attachments) EXPECT_EQ(att.source.origin, Origin::kPaste);
}

TEST_F(IngestionCoordinatorTest, PasteOfDataUriAttachesImage) {
  std::string png = "\x89PNG\r\n\x1a\nrest";
  auto coordinator = Make(absl::StrCat("data:image/png;base64,", absl::Base64Escape(png)));

  PasteOutcome outcome = coordinator->Paste();
  ASSERT_EQ(outcome.attachments.size(), 1u);
  const Attachment& att = outcome.attachments[0];
  EXPECT_EQ(att.kind, AttachmentKind::kImage);
  EXPECT_EQ(att.mime_type, "image/png");
  ASSERT_TRUE(att.is_temp_file());
  EXPECT_EQ(fs::file_size(*att.temp_path), png.size());
}

TEST_F(IngestionCoordinatorTest, PasteOfPlainTextAttachesNothing) {
  auto coordinator = Make("just words");
  PasteOutcome outcome = coordinator->Paste();
  EXPECT_EQ(outcome.type, ClipboardContent::Type::kText);
  EXPECT_EQ(outcome.text, "just words");
  EXPECT_TRUE(outcome.attachments.empty());
}

TEST_F(IngestionCoordinatorTest, DroppedPathIsCopiedIntoScratch) {
  std::string file = WriteFile("report.txt", "quarterly");
  auto coordinator = Make();

  coordinator->SubmitRawTerminalBytes(absl::StrCat("\x1b[200~", file, "\x1b[201~"));
  coordinator->WaitIdle();

  auto list = coordinator->ListAttachments();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].source.origin, Origin::kDrag);
  ASSERT_TRUE(list[0].is_temp_file());
  EXPECT_NE(*list[0].temp_path, file);
  EXPECT_EQ(fs::path(*list[0].temp_path).parent_path().string(), Path("scratch"));
  EXPECT_TRUE(fs::exists(file));
  ASSERT_EQ(observer_.completed.size(), 1u);
  EXPECT_EQ(observer_.completed[0], 1);
  EXPECT_EQ(observer_.completed_status[0], SessionStatus::kCommitted);
}

TEST_F(IngestionCoordinatorTest, RedropWithinWindowIsSkipped) {
  std::string file = WriteFile("report.txt", "quarterly");
  auto coordinator = Make();
  std::string drop = absl::StrCat("\x1b[200~", file, "\x1b[201~");

  coordinator->SubmitRawTerminalBytes(drop);
  coordinator->WaitIdle();
  ASSERT_EQ(coordinator->ClearAttachments(), 1);

  coordinator->SubmitRawTerminalBytes(drop);
  coordinator->WaitIdle();
  EXPECT_EQ(coordinator->Stats().count, 0);
  bool skipped = false;
  for (const auto& message : observer_.progress) skipped |= message.find("Skipped report.txt") != std::string::npos;
  EXPECT_TRUE(skipped);
}

TEST_F(IngestionCoordinatorTest, TypedPathWaitsForWriterToFinish) {
  UseSlowSettling();
  auto coordinator = Make();
  std::string file = Path("capture.log");
  std::thread writer = StartSlowWriter(file, 16);

  auto att = coordinator->SubmitFilePath(file);
  writer.join();
  ASSERT_TRUE(att.ok()) << att.status();
  EXPECT_EQ(att->size_bytes, 16 * 1024);
  EXPECT_EQ(att->bytes.size(), 16u * 1024);
}

TEST_F(IngestionCoordinatorTest, DroppedGrowingFileIsAttachedWhenComplete) {
  UseSlowSettling();
  auto coordinator = Make();
  std::string file = Path("recording.log");
  std::thread writer = StartSlowWriter(file, 16);

  coordinator->SubmitRawTerminalBytes(absl::StrCat("\x1b[200~", file, "\x1b[201~"));
  coordinator->WaitIdle();
  writer.join();

  auto list = coordinator->ListAttachments();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].size_bytes, 16 * 1024);
  ASSERT_TRUE(list[0].is_temp_file());
  EXPECT_EQ(fs::file_size(*list[0].temp_path), 16u * 1024);
}

TEST_F(IngestionCoordinatorTest, LongDropSessionKeepsEveryFile) {
  // Ten candidates settle for 30ms each, one after another: the session as a
  // whole runs about twice as long as session_timeout.
  config_.stability.settle_delay = absl::Milliseconds(30);
  config_.detection_window = absl::Milliseconds(150);
  config_.session_timeout = absl::Milliseconds(150);
  config_.poll_interval = absl::Milliseconds(5);
  config_.worker_threads = 1;
  std::vector<std::string> files;
  for (int i = 0; i < 10; ++i) files.push_back(WriteFile(absl::StrCat("part", i, ".txt"), "data"));
  auto coordinator = Make();
  ASSERT_TRUE(coordinator->StartDetection().ok());

  coordinator->SubmitRawTerminalBytes(absl::StrCat("\x1b[200~", absl::StrJoin(files, "\n"), "\x1b[201~"));
  coordinator->WaitIdle();

  EXPECT_EQ(coordinator->Stats().count, 10);
  ASSERT_EQ(observer_.completed.size(), 1u);
  EXPECT_EQ(observer_.completed[0], 10);
  EXPECT_EQ(observer_.completed_status[0], SessionStatus::kCommitted);
  for (const auto& message : observer_.progress) EXPECT_EQ(message.find("Skipped"), std::string::npos) << message;
}

TEST_F(IngestionCoordinatorTest, RecentDropsArePrunedAfterWindow) {
  config_.detection_window = absl::Milliseconds(100);
  config_.session_timeout = absl::Milliseconds(100);
  std::string file = WriteFile("report.txt", "quarterly");
  std::string drop = absl::StrCat("\x1b[200~", file, "\x1b[201~");
  auto coordinator = Make();

  coordinator->SubmitRawTerminalBytes(drop);
  coordinator->WaitIdle();
  EXPECT_EQ(coordinator->RecentDropCount(), 1u);
  ASSERT_EQ(coordinator->ClearAttachments(), 1);

  absl::SleepFor(absl::Milliseconds(150));
  ASSERT_TRUE(coordinator->SubmitFilePath(WriteFile("other.txt", "x")).ok());
  EXPECT_EQ(coordinator->RecentDropCount(), 0u);

  coordinator->SubmitRawTerminalBytes(drop);
  coordinator->WaitIdle();
  EXPECT_EQ(coordinator->Stats().count, 2);
}

TEST_F(IngestionCoordinatorTest, FlushScansUnterminatedPaste) {
  std::string file = WriteFile("notes.md", "# notes");
  auto coordinator = Make();

  coordinator->SubmitRawTerminalBytes(absl::StrCat("\x1b[200~", file));
  coordinator->WaitIdle();
  EXPECT_EQ(coordinator->Stats().count, 0);

  coordinator->FlushTerminalInput();
  coordinator->WaitIdle();
  EXPECT_EQ(coordinator->Stats().count, 1);
}

TEST_F(IngestionCoordinatorTest, InlineTransferBecomesAttachment) {
  auto coordinator = Make();
  coordinator->SubmitRawTerminalBytes(absl::StrCat("\x1b]1337;File=name=", absl::Base64Escape("pic.png"), ":",
                                                   absl::Base64Escape("\x89PNG\r\n\x1a\n"), "\x07"));
  coordinator->WaitIdle();

  auto list = coordinator->ListAttachments();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].filename, "pic.png");
  EXPECT_EQ(list[0].kind, AttachmentKind::kImage);
  EXPECT_FALSE(list[0].source.original_path.has_value());
}

TEST_F(IngestionCoordinatorTest, ShutdownSweepsScratchAndRefusesWork) {
  auto coordinator = Make();
  ASSERT_TRUE(coordinator->SubmitBuffer("abc", "a.txt").ok());
  ASSERT_TRUE(coordinator->SubmitBuffer("def", "b.txt").ok());

  coordinator->Shutdown();
  coordinator->Shutdown();
  EXPECT_EQ(coordinator->Stats().count, 0);
  EXPECT_FALSE(fs::exists(Path("scratch")));

  std::string file = WriteFile("late.txt", "late");
  EXPECT_EQ(coordinator->SubmitFilePath(file).status().code(), absl::StatusCode::kCancelled);
  EXPECT_EQ(coordinator->SubmitBuffer("x", "x.txt").status().code(), absl::StatusCode::kCancelled);
  EXPECT_FALSE(coordinator->StartDetection().ok());
}

TEST_F(IngestionCoordinatorTest, ClearRemovesEverything) {
  auto coordinator = Make();
  ASSERT_TRUE(coordinator->SubmitFilePath(WriteFile("a.txt", "a")).ok());
  ASSERT_TRUE(coordinator->SubmitBuffer("b", "b.txt").ok());
  EXPECT_EQ(coordinator->ClearAttachments(), 2);
  EXPECT_TRUE(coordinator->ListAttachments().empty());
  EXPECT_EQ(coordinator->RemoveAttachment("att_1").code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace dropin
