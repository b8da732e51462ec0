#include "core/clipboard_source.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"

#include "core/test_util.h"

namespace dropin {
namespace {

namespace fs = std::filesystem;

class FakeClipboardProvider : public ClipboardProvider {
 public:
  FakeClipboardProvider(absl::StatusOr<std::string> text, absl::StatusOr<std::string> png)
      : text_(std::move(text)), png_(std::move(png)) {}

  absl::StatusOr<std::string> ReadText() override { return text_; }
  absl::StatusOr<std::string> ReadImagePng() override {
    png_reads++;
    return png_;
  }

  int png_reads = 0;

 private:
  absl::StatusOr<std::string> text_;
  absl::StatusOr<std::string> png_;
};

class ClipboardSourceTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    scratch_ = std::make_unique<ScratchDirectory>(Path("scratch"));
  }

  ClipboardContent ReadWith(absl::StatusOr<std::string> text,
                            absl::StatusOr<std::string> png = absl::NotFoundError("no image")) {
    ClipboardSource source(std::make_unique<FakeClipboardProvider>(std::move(text), std::move(png)), scratch_.get());
    return source.Read();
  }

  std::unique_ptr<ScratchDirectory> scratch_;
};

TEST_F(ClipboardSourceTest, PlainTextStaysText) {
  ClipboardContent c = ReadWith(std::string("  just some words \n"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
  EXPECT_EQ(c.text, "just some words");
}

TEST_F(ClipboardSourceTest, DataUriIsImageEvenWithPathLikePayload) {
  std::string bytes = "\x89PNG\r\n\x1a\n/tmp/looks/like/a/path";
  std::string uri = absl::StrCat("data:image/png;base64,", absl::Base64Escape(bytes));
  ASSERT_NE(uri.find('/'), std::string::npos);

  ClipboardContent c = ReadWith(uri);
  ASSERT_EQ(c.type, ClipboardContent::Type::kImage);
  EXPECT_EQ(c.mime_type, "image/png");
  EXPECT_EQ(c.size_bytes, static_cast<int64_t>(bytes.size()));
  EXPECT_TRUE(scratch_->Owns(c.temp_path));
  EXPECT_EQ(fs::file_size(c.temp_path), bytes.size());
  EXPECT_EQ(fs::path(c.filename).extension().string(), ".png");
}

TEST_F(ClipboardSourceTest, UnsupportedDataUriFormatIsText) {
  ClipboardContent c = ReadWith(std::string("data:image/tiff;base64,AAAA"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
}

TEST_F(ClipboardSourceTest, UndecodableDataUriYieldsEmptyText) {
  ClipboardContent c = ReadWith(std::string("data:image/png;base64,A"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
  EXPECT_TRUE(c.text.empty());
}

TEST_F(ClipboardSourceTest, SingleQuotedPath) {
  std::string file = WriteFile("report.pdf", "%PDF");
  ClipboardContent c = ReadWith(absl::StrCat("'", file, "'"));
  ASSERT_EQ(c.type, ClipboardContent::Type::kFile);
  EXPECT_EQ(c.paths, std::vector<std::string>{file});
}

TEST_F(ClipboardSourceTest, MissingPathIsText) {
  ClipboardContent c = ReadWith(Path("missing.pdf"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
}

TEST_F(ClipboardSourceTest, TwoExistingFilesBecomeAFileList) {
  std::string report = WriteFile("report.pdf", "%PDF");
  std::string notes = WriteFile("notes.txt", "notes");
  ClipboardContent c = ReadWith(absl::StrCat(report, "\n", notes, "\n", Path("gone.txt")));
  ASSERT_EQ(c.type, ClipboardContent::Type::kFiles);
  EXPECT_EQ(c.paths, (std::vector<std::string>{report, notes}));
}

TEST_F(ClipboardSourceTest, OneExistingFileAmongLinesIsText) {
  std::string report = WriteFile("report.pdf", "%PDF");
  ClipboardContent c = ReadWith(absl::StrCat(report, "\nsome prose"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
}

TEST_F(ClipboardSourceTest, EmptyTextFallsBackToProviderImage) {
  ClipboardContent c = ReadWith(std::string(""), std::string("\x89PNGraw"));
  ASSERT_EQ(c.type, ClipboardContent::Type::kImage);
  EXPECT_EQ(c.mime_type, "image/png");
  EXPECT_EQ(c.size_bytes, 7);
}

TEST_F(ClipboardSourceTest, ProviderFailureYieldsEmptyText) {
  ClipboardContent c = ReadWith(absl::UnavailableError("no display"));
  EXPECT_EQ(c.type, ClipboardContent::Type::kText);
  EXPECT_TRUE(c.text.empty());
}

TEST_F(ClipboardSourceTest, NonEmptyTextNeverAsksForImage) {
  auto provider = std::make_unique<FakeClipboardProvider>(std::string("hello"), std::string("png"));
  FakeClipboardProvider* raw = provider.get();
  ClipboardSource source(std::move(provider), scratch_.get());
  EXPECT_EQ(source.Read().type, ClipboardContent::Type::kText);
  EXPECT_EQ(raw->png_reads, 0);
}

}  // namespace
}  // namespace dropin
