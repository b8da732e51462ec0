#ifndef DROPIN_TEST_UTIL_H_
#define DROPIN_TEST_UTIL_H_

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace dropin {

// Fixture giving each test its own directory under the gtest temp dir.
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::path(::testing::TempDir()) /
           absl::StrCat("dropin_", info->test_suite_name(), "_", info->name(), "_", absl::ToUnixNanos(absl::Now()));
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::string Path(std::string_view name) const { return (dir_ / std::string(name)).string(); }

  std::string WriteFile(std::string_view name, std::string_view content) const {
    std::string path = Path(name);
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
  }

  std::filesystem::path dir_;
};

}  // namespace dropin

#endif  // DROPIN_TEST_UTIL_H_
