#include "interface/ui.h"

#include <sstream>

#include <gtest/gtest.h>

#include "absl/strings/match.h"

#include "core/ingest_error.h"

namespace dropin {
namespace {

TEST(UiTest, FormatFileSize) {
  EXPECT_EQ(FormatFileSize(0), "0 B");
  EXPECT_EQ(FormatFileSize(1023), "1023 B");
  EXPECT_EQ(FormatFileSize(1536), "1.5 KB");
  EXPECT_EQ(FormatFileSize(5 * 1024 * 1024), "5.0 MB");
}

TEST(UiTest, FormatRejectionNamesKind) {
  EXPECT_EQ(FormatRejection(IngestError(IngestErrorKind::kTooLarge, "big")), "[TooLarge] big");
  EXPECT_EQ(FormatRejection(absl::CancelledError("stopped")), "stopped");
}

TEST(UiTest, AttachmentListShowsEachEntry) {
  EXPECT_TRUE(absl::StrContains(FormatAttachmentList({}), "No attachments"));

  Attachment a;
  a.id = "att_3";
  a.filename = "chart.png";
  a.kind = AttachmentKind::kImage;
  a.size_bytes = 2048;
  a.mime_type = "image/png";
  a.source.origin = Origin::kDrag;
  std::string out = FormatAttachmentList({a});
  EXPECT_TRUE(absl::StrContains(out, "att_3"));
  EXPECT_TRUE(absl::StrContains(out, "chart.png"));
  EXPECT_TRUE(absl::StrContains(out, "2.0 KB"));
  EXPECT_TRUE(absl::StrContains(out, "drag"));
}

TEST(UiTest, StatsMentionLimitsAndDetection) {
  AttachmentStats stats;
  stats.count = 2;
  stats.total_size = 1024;
  stats.image_count = 1;
  stats.file_count = 1;
  DragEngineStats detection;
  detection.active = true;
  detection.dragging = true;
  detection.session_id = "session-1-1";
  std::string out = FormatStats(stats, 10, 50 * 1024 * 1024, detection);
  EXPECT_TRUE(absl::StrContains(out, "2/10"));
  EXPECT_TRUE(absl::StrContains(out, "50.0 MB"));
  EXPECT_TRUE(absl::StrContains(out, "running"));
  EXPECT_TRUE(absl::StrContains(out, "session-1-1"));
}

TEST(UiTest, VisibleLengthSkipsAnsi) {
  EXPECT_EQ(VisibleLength(Colorize("abc", "", ansi::Red)), 3u);
  EXPECT_EQ(VisibleLength("h\xC3\xA9llo"), 5u);
}

TEST(UiTest, ConsoleObserverPrintsEvents) {
  std::stringstream out;
  ConsoleObserver observer(out);
  Attachment a;
  a.id = "att_1";
  a.filename = "notes.txt";
  a.size_bytes = 10;
  observer.OnAttachmentAdded(a);
  observer.OnDragSessionError(DetectionSession{}, IngestError(IngestErrorKind::kStabilityTimeout, "no files"));
  observer.OnDragSessionCompleted(DetectionSession{}, {a});

  std::string text = out.str();
  EXPECT_TRUE(absl::StrContains(text, "Attached notes.txt"));
  EXPECT_TRUE(absl::StrContains(text, "[StabilityTimeout] no files"));
  EXPECT_TRUE(absl::StrContains(text, "1 file(s) attached"));
}

}  // namespace
}  // namespace dropin
