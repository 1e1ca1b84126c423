#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "tasknag/config/config.hpp"
#include "test_helpers.hpp"

using namespace tasknag::config;
using namespace tasknag::test;
using tasknag::ErrorCode;

class ConfigTest : public TempDirTest {
protected:
  std::filesystem::path writeConfig(const std::string& content) {
    auto path = temp_dir_ / "config.toml";
    std::ofstream file(path);
    file << content;
    return path;
  }
};

TEST_F(ConfigTest, DefaultsAreValid) {
  Config config;
  EXPECT_OK(config.validate());
  EXPECT_EQ(config.scheduler.interval_minutes, 15);
  EXPECT_EQ(config.scheduler.tolerance_minutes, 15);
  EXPECT_TRUE(config.scheduler.align_to_boundary);
  EXPECT_EQ(config.browser.open_timeout_ms, 3000);
  EXPECT_EQ(config.url.max_length, 2048u);
  EXPECT_EQ(config.storage.database.filename(), "tasknag.db");
}

TEST_F(ConfigTest, LoadOverlaysFile) {
  auto path = writeConfig(R"(
[scheduler]
interval_minutes = 30
tolerance_minutes = 30

[browser]
pacing_ms = 0
opener = "firefox"

[url]
allowed_protocols = ["https"]

[alert]
sound_args = ["-i", "bell"]

[storage]
database = "/tmp/tasks.db"
)");

  Config config;
  ASSERT_OK(config.load(path));
  EXPECT_EQ(config.scheduler.interval_minutes, 30);
  EXPECT_EQ(config.browser.pacing_ms, 0);
  EXPECT_EQ(config.browser.opener, "firefox");
  EXPECT_EQ(config.url.allowed_protocols, (std::vector<std::string>{"https"}));
  EXPECT_EQ(config.alert.sound_args, (std::vector<std::string>{"-i", "bell"}));
  EXPECT_EQ(config.storage.database, "/tmp/tasks.db");
  EXPECT_EQ(config.browser.open_timeout_ms, 3000);
  EXPECT_EQ(config.path(), path);
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
  Config config;
  EXPECT_ERROR(config.load(temp_dir_ / "absent.toml"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, MalformedTomlIsParseError) {
  Config config;
  EXPECT_ERROR(config.load(writeConfig("[scheduler\ninterval_minutes = ")), ErrorCode::kParseError);
}

TEST_F(ConfigTest, NonPositiveMaxLengthIsRejectedOnLoad) {
  Config config;
  EXPECT_ERROR(config.load(writeConfig("[url]\nmax_length = -1\n")), ErrorCode::kConfigError);
  EXPECT_EQ(config.url.max_length, 2048u);

  Config zero;
  EXPECT_ERROR(zero.load(writeConfig("[url]\nmax_length = 0\n")), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, SaveAndReload) {
  Config config;
  ASSERT_OK(config.set("scheduler.interval_minutes", "5"));
  ASSERT_OK(config.set("scheduler.tolerance_minutes", "10"));
  ASSERT_OK(config.set("alert.focus_args", "-a, TaskNag"));

  auto path = temp_dir_ / "saved" / "config.toml";
  ASSERT_OK(config.save(path));

  Config reloaded;
  ASSERT_OK(reloaded.load(path));
  EXPECT_EQ(reloaded.scheduler.interval_minutes, 5);
  EXPECT_EQ(reloaded.scheduler.tolerance_minutes, 10);
  EXPECT_EQ(reloaded.alert.focus_args, (std::vector<std::string>{"-a", "TaskNag"}));
}

TEST_F(ConfigTest, GetAndSetByKey) {
  Config config;
  for (const auto& key : Config::keys()) {
    EXPECT_OK(config.get(key));
  }

  ASSERT_OK(config.set("scheduler.align_to_boundary", "false"));
  EXPECT_EQ(config.get("scheduler.align_to_boundary").value_or(""), "false");

  ASSERT_OK(config.set("url.blocked_protocols", "javascript,data"));
  EXPECT_EQ(config.get("url.blocked_protocols").value_or(""), "javascript,data");

  EXPECT_ERROR(config.get("scheduler.missing"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("nope", "1"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("scheduler.interval_minutes", "fifteen"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("scheduler.align_to_boundary", "maybe"), ErrorCode::kConfigError);
  EXPECT_ERROR(config.set("url.max_length", "0"), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ValidateRejectsBadSchedules) {
  Config config;
  config.scheduler.interval_minutes = 7;
  config.scheduler.tolerance_minutes = 7;
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);

  config.scheduler.interval_minutes = 30;
  config.scheduler.tolerance_minutes = 15;
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);

  config.scheduler.tolerance_minutes = 45;
  EXPECT_OK(config.validate());
}

TEST_F(ConfigTest, ValidateRejectsConflictingProtocols) {
  Config config;
  config.url.blocked_protocols.push_back("http");
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);

  config = Config();
  config.url.allowed_protocols.clear();
  EXPECT_ERROR(config.validate(), ErrorCode::kConfigError);
}

TEST_F(ConfigTest, ResolvesEnvironmentReferences) {
  setenv("TASKNAG_TEST_OPENER", "my-browser", 1);
  Config config;
  EXPECT_EQ(config.resolveEnvVar("env:TASKNAG_TEST_OPENER"), "my-browser");
  EXPECT_EQ(config.resolveEnvVar("plain"), "plain");
  unsetenv("TASKNAG_TEST_OPENER");
  EXPECT_EQ(config.resolveEnvVar("env:TASKNAG_TEST_OPENER"), "");
}
