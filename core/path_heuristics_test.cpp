#include "core/path_heuristics.h"

#include <gtest/gtest.h>

namespace dropin {
namespace {

TEST(PathHeuristicsTest, SplitShellWords) {
  EXPECT_EQ(SplitShellWords("a 'b c' \"d \\\" e\" f\\ g"),
            (std::vector<std::string>{"a", "b c", "d \" e", "f g"}));
  EXPECT_TRUE(SplitShellWords("   ").empty());
}

TEST(PathHeuristicsTest, DecodeFileUri) {
  EXPECT_EQ(DecodeFileUri("file:///tmp/a%20b"), "/tmp/a b");
  EXPECT_EQ(DecodeFileUri("file://localhost/etc/hosts"), "/etc/hosts");
  EXPECT_EQ(DecodeFileUri("file:///C:/Users/x.txt"), "C:/Users/x.txt");
  EXPECT_EQ(DecodeFileUri("file://server/share/x"), std::nullopt);
  EXPECT_EQ(DecodeFileUri("http://example.com/x"), std::nullopt);
}

TEST(PathHeuristicsTest, PercentDecodeKeepsMalformedEscapes) {
  EXPECT_EQ(PercentDecode("100%"), "100%");
  EXPECT_EQ(PercentDecode("%zz%41"), "%zzA");
}

TEST(PathHeuristicsTest, ExtractBarePathsSkipsPlainWords) {
  EXPECT_EQ(ExtractBarePaths("see /tmp/x and C:\\\\temp\\\\y.txt but not notes.txt"),
            (std::vector<std::string>{"/tmp/x", "C:\\temp\\y.txt"}));
  EXPECT_TRUE(ExtractBarePaths("just / a slash").empty());
}

TEST(PathHeuristicsTest, LooksLikeFilePath) {
  EXPECT_TRUE(LooksLikeFilePath("/tmp/report.pdf"));
  EXPECT_TRUE(LooksLikeFilePath("C:\\Users\\me\\a.png"));
  EXPECT_TRUE(LooksLikeFilePath("../notes.md"));
  EXPECT_TRUE(LooksLikeFilePath("report.pdf"));
  EXPECT_TRUE(LooksLikeFilePath("docs/readme"));
  EXPECT_FALSE(LooksLikeFilePath("hello world"));
  EXPECT_FALSE(LooksLikeFilePath("end of sentence."));
  EXPECT_FALSE(LooksLikeFilePath("/tmp/a\n/tmp/b"));
  EXPECT_FALSE(LooksLikeFilePath(""));
}

}  // namespace
}  // namespace dropin
