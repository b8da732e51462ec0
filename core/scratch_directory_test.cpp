#include "core/scratch_directory.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "absl/strings/match.h"

#include "core/ingest_error.h"
#include "core/test_util.h"

namespace dropin {
namespace {

namespace fs = std::filesystem;

std::string Slurp(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class ScratchDirectoryTest : public TempDirTest {};

TEST(SanitizeFilenameTest, StripsSeparatorsAndDots) {
  EXPECT_EQ(SanitizeFilename("../../etc/passwd"), "passwd");
  EXPECT_EQ(SanitizeFilename(".hidden"), "hidden");
  EXPECT_EQ(SanitizeFilename(""), "attachment");
  EXPECT_EQ(SanitizeFilename("shot 1.png"), "shot 1.png");
}

TEST_F(ScratchDirectoryTest, MaterializeNamesFileWithTimestamp) {
  ScratchDirectory scratch(Path("scratch"));
  auto path_or = scratch.Materialize("hello", "note.txt");
  ASSERT_TRUE(path_or.ok()) << path_or.status();

  std::string leaf = fs::path(*path_or).filename().string();
  EXPECT_TRUE(absl::EndsWith(leaf, "-note.txt")) << leaf;
  EXPECT_GE(leaf.find('-'), 13u);
  EXPECT_EQ(Slurp(*path_or), "hello");
  EXPECT_TRUE(scratch.Owns(*path_or));
}

TEST_F(ScratchDirectoryTest, SameNameTwiceGivesDistinctFiles) {
  ScratchDirectory scratch(Path("scratch"));
  auto a = scratch.Materialize("a", "x.bin");
  auto b = scratch.Materialize("b", "x.bin");
  ASSERT_TRUE(a.ok());
  ASSERT_TRUE(b.ok());
  EXPECT_NE(*a, *b);
  EXPECT_EQ(Slurp(*a), "a");
  EXPECT_EQ(Slurp(*b), "b");
}

TEST_F(ScratchDirectoryTest, RemoveRefusesForeignPaths) {
  ScratchDirectory scratch(Path("scratch"));
  std::string outside = WriteFile("keep.txt", "keep");
  absl::Status s = scratch.Remove(outside);
  EXPECT_EQ(s.code(), absl::StatusCode::kPermissionDenied);
  EXPECT_TRUE(fs::exists(outside));

  auto inside = scratch.Materialize("x", "x.txt");
  ASSERT_TRUE(inside.ok());
  EXPECT_TRUE(scratch.Remove(*inside).ok());
  EXPECT_FALSE(fs::exists(*inside));
  EXPECT_TRUE(IsIngestError(scratch.Remove(*inside), IngestErrorKind::kNotFound));
}

TEST_F(ScratchDirectoryTest, OwnsRejectsPrefixSiblings) {
  ScratchDirectory scratch(Path("scratch"));
  EXPECT_FALSE(scratch.Owns(Path("scratch-other/file")));
  EXPECT_FALSE(scratch.Owns(Path("scratch")));
  EXPECT_TRUE(scratch.Owns(Path("scratch/file")));
}

TEST_F(ScratchDirectoryTest, SweepRemovesLeftoversAndDirectory) {
  ScratchDirectory scratch(Path("scratch"));
  ASSERT_TRUE(scratch.Materialize("1", "a").ok());
  ASSERT_TRUE(scratch.Materialize("2", "b").ok());
  EXPECT_EQ(scratch.Sweep(), 2);
  EXPECT_FALSE(fs::exists(scratch.root()));
  EXPECT_EQ(scratch.Sweep(), 0);
}

}  // namespace
}  // namespace dropin
