#include "core/ingest_config.h"

#include <cstdlib>

#include <gtest/gtest.h>


namespace dropin {
namespace {

TEST(IngestConfigTest, DefaultsAreValid) {
  IngestConfig config;
  EXPECT_TRUE(ValidateConfig(config).ok());
  EXPECT_EQ(config.max_attachments, 10);
  EXPECT_EQ(config.max_total_size_bytes, 50 * kMiB);
  EXPECT_EQ(config.detection_window, absl::Seconds(3));
  EXPECT_EQ(config.poll_interval, absl::Milliseconds(500));
  EXPECT_LT(config.explicit_settle_delay, config.stability.settle_delay);
}

TEST(IngestConfigTest, RejectsBadValues) {
  IngestConfig config;
  config.max_attachments = 0;
  EXPECT_EQ(ValidateConfig(config).code(), absl::StatusCode::kInvalidArgument);

  config = IngestConfig();
  config.poll_interval = absl::Seconds(2);
  EXPECT_FALSE(ValidateConfig(config).ok());

  config = IngestConfig();
  config.session_timeout = absl::Seconds(1);
  EXPECT_FALSE(ValidateConfig(config).ok());

  config = IngestConfig();
  config.stability.backoff = 0.5;
  EXPECT_FALSE(ValidateConfig(config).ok());

  config = IngestConfig();
  config.explicit_settle_delay = absl::ZeroDuration();
  EXPECT_FALSE(ValidateConfig(config).ok());
}

TEST(IngestConfigTest, ScratchDirectoryFollowsTmpdir) {
  const char* old = std::getenv("TMPDIR");
  std::string saved = old ? old : "";
  setenv("TMPDIR", "/var/tmp/dropin-test", 1);
  EXPECT_EQ(SystemTempDirectory(), "/var/tmp/dropin-test");
  EXPECT_EQ(DefaultScratchDirectory(), "/var/tmp/dropin-test/dropin-attachments");
  if (old) {
    setenv("TMPDIR", saved.c_str(), 1);
  } else {
    unsetenv("TMPDIR");
  }
}

}  // namespace
}  // namespace dropin
