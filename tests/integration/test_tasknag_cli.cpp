#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "tasknag/cli/application.hpp"
#include "tasknag/store/sqlite_task_source.hpp"
#include "test_helpers.hpp"

namespace tasknag::cli {

using test::makeRecurringRecord;

class TasknagCliTest : public test::TempDirTest {
protected:
  struct CommandOutput {
    int exit_code = 0;
    std::string out;
    std::string err;
  };

  void SetUp() override {
    TempDirTest::SetUp();

    config_home_ = temp_dir_ / "config";
    data_home_ = temp_dir_ / "data";
    db_path_ = temp_dir_ / "tasks.db";

    // Keep the real user configuration out of reach
    setenv("XDG_CONFIG_HOME", config_home_.c_str(), 1);
    setenv("XDG_DATA_HOME", data_home_.c_str(), 1);
  }

  void TearDown() override {
    unsetenv("XDG_CONFIG_HOME");
    unsetenv("XDG_DATA_HOME");
    TempDirTest::TearDown();
  }

  void seed(const core::TaskRecord& record) {
    store::SqliteTaskSource source(db_path_);
    ASSERT_OK(source.initialize());
    ASSERT_OK(source.upsert(record));
  }

  // Runs one invocation against a fresh Application, capturing both streams
  CommandOutput runCommand(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>("tasknag"));
    for (const auto& arg : args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }

    std::ostringstream cout_output, cerr_output;
    std::streambuf* orig_cout = std::cout.rdbuf();
    std::streambuf* orig_cerr = std::cerr.rdbuf();
    std::cout.rdbuf(cout_output.rdbuf());
    std::cerr.rdbuf(cerr_output.rdbuf());

    CommandOutput output;
    try {
      Application app;
      output.exit_code = app.run(static_cast<int>(argv.size()), argv.data());
    } catch (const std::exception&) {
      std::cout.rdbuf(orig_cout);
      std::cerr.rdbuf(orig_cerr);
      throw;
    }

    std::cout.rdbuf(orig_cout);
    std::cerr.rdbuf(orig_cerr);

    output.out = cout_output.str();
    output.err = cerr_output.str();
    return output;
  }

  std::vector<std::string> engineArgs(std::initializer_list<std::string> rest) {
    std::vector<std::string> args = {"--db", db_path_.string(), "--console"};
    args.insert(args.end(), rest.begin(), rest.end());
    return args;
  }

  std::filesystem::path configFile() const { return config_home_ / "tasknag" / "config.toml"; }

  std::filesystem::path config_home_;
  std::filesystem::path data_home_;
  std::filesystem::path db_path_;
};

TEST_F(TasknagCliTest, CheckJsonReportsFiredReminders) {
  seed(makeRecurringRecord("r", "[3]", "09:00", 1));

  auto result = runCommand(engineArgs({"--json", "check", "--at", "2025-03-12T09:05:00"}));
  ASSERT_EQ(result.exit_code, 0) << result.err;

  auto json = nlohmann::json::parse(result.out);
  EXPECT_FALSE(json["dryRun"].get<bool>());
  ASSERT_EQ(json["notifications"].size(), 1u);
  EXPECT_EQ(json["notifications"][0]["taskId"], "r");
  EXPECT_EQ(json["notifications"][0]["kind"], "recurring");
  EXPECT_EQ(json["notifications"][0]["level"], 1);

  // The console alert goes to stderr so stdout stays parseable
  EXPECT_NE(result.err.find("Recurring reminder: Task r"), std::string::npos);
}

TEST_F(TasknagCliTest, CheckJsonIsEmptyWhenNothingIsDue) {
  seed(makeRecurringRecord("r", "[3]", "09:00", 1));

  auto result = runCommand(engineArgs({"--json", "check", "--at", "2025-03-12T10:00:00"}));
  ASSERT_EQ(result.exit_code, 0) << result.err;

  auto json = nlohmann::json::parse(result.out);
  ASSERT_TRUE(json["notifications"].is_array());
  EXPECT_TRUE(json["notifications"].empty());
  EXPECT_EQ(result.err.find("Task r"), std::string::npos);
}

TEST_F(TasknagCliTest, DryRunListsWithoutAlerting) {
  seed(makeRecurringRecord("r", "[3]", "09:00", 1));

  auto result = runCommand(engineArgs({"--json", "check", "--dry-run", "--at", "2025-03-12T09:00:00"}));
  ASSERT_EQ(result.exit_code, 0) << result.err;

  auto json = nlohmann::json::parse(result.out);
  EXPECT_TRUE(json["dryRun"].get<bool>());
  ASSERT_EQ(json["notifications"].size(), 1u);
  EXPECT_EQ(result.err.find("Task r"), std::string::npos);
}

TEST_F(TasknagCliTest, CheckTextSummary) {
  seed(makeRecurringRecord("r", "[3]", "09:00", 2));

  auto result = runCommand(engineArgs({"check", "--at", "2025-03-12T09:00:00"}));
  ASSERT_EQ(result.exit_code, 0) << result.err;
  EXPECT_NE(result.out.find("🔔 Recurring reminder: Task r"), std::string::npos);
  EXPECT_NE(result.out.find("Notified 1 task(s)"), std::string::npos);
}

TEST_F(TasknagCliTest, CheckRejectsMalformedTime) {
  auto json_result = runCommand(engineArgs({"--json", "check", "--at", "yesterday"}));
  EXPECT_EQ(json_result.exit_code, 1);

  auto json = nlohmann::json::parse(json_result.out);
  EXPECT_NE(json["error"].get<std::string>().find("Invalid --at time"), std::string::npos);
  EXPECT_EQ(json["code"].get<int>(), static_cast<int>(ErrorCode::kInvalidArgument));

  auto text_result = runCommand(engineArgs({"check", "--at", "2025-13-40T09:00:00"}));
  EXPECT_EQ(text_result.exit_code, 1);
  EXPECT_NE(text_result.err.find("Error: Invalid --at time"), std::string::npos);
}

TEST_F(TasknagCliTest, ConfigSetRefusesInvalidSchedule) {
  auto interval = runCommand({"--json", "config", "set", "scheduler.interval_minutes", "7"});
  EXPECT_EQ(interval.exit_code, 1);
  auto interval_error = nlohmann::json::parse(interval.out);
  EXPECT_NE(interval_error["error"].get<std::string>().find("positive divisor of 1440"),
            std::string::npos);
  EXPECT_EQ(interval_error["code"].get<int>(), static_cast<int>(ErrorCode::kConfigError));
  EXPECT_FALSE(std::filesystem::exists(configFile()));

  auto tolerance = runCommand({"config", "set", "scheduler.tolerance_minutes", "5"});
  EXPECT_EQ(tolerance.exit_code, 1);
  EXPECT_NE(tolerance.err.find("must not be smaller than scheduler.interval_minutes"),
            std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(configFile()));

  auto accepted = runCommand({"config", "set", "scheduler.tolerance_minutes", "30"});
  ASSERT_EQ(accepted.exit_code, 0) << accepted.err;
  EXPECT_NE(accepted.out.find("Configuration updated: scheduler.tolerance_minutes = 30"),
            std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(configFile()));

  auto reread = runCommand({"config", "get", "scheduler.tolerance_minutes"});
  ASSERT_EQ(reread.exit_code, 0) << reread.err;
  EXPECT_NE(reread.out.find("scheduler.tolerance_minutes = 30"), std::string::npos);
}

TEST_F(TasknagCliTest, UrlValidateJson) {
  auto valid = runCommand({"--json", "url", "validate", "google"});
  EXPECT_EQ(valid.exit_code, 0);
  auto valid_json = nlohmann::json::parse(valid.out);
  EXPECT_TRUE(valid_json["isValid"].get<bool>());
  EXPECT_EQ(valid_json["normalizedUrl"], "https://google");

  auto invalid = runCommand({"--json", "url", "validate", "javascript:alert(1)"});
  EXPECT_EQ(invalid.exit_code, 1);
  auto invalid_json = nlohmann::json::parse(invalid.out);
  EXPECT_FALSE(invalid_json["isValid"].get<bool>());
  EXPECT_EQ(invalid_json["error"], "URL contains dangerous patterns");
}

TEST_F(TasknagCliTest, TestNotifySendsToConsole) {
  seed(makeRecurringRecord("r", "[1]", "18:00", 1));

  auto result = runCommand(engineArgs({"test-notify"}));
  ASSERT_EQ(result.exit_code, 0) << result.err;
  EXPECT_NE(result.out.find("Recurring reminder (test): Task r"), std::string::npos);
  EXPECT_NE(result.out.find("Sent 1 test notification(s)"), std::string::npos);
}

}  // namespace tasknag::cli
