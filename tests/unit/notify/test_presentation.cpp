#include <gtest/gtest.h>

#include <sstream>

#include "tasknag/notify/presentation_sink.hpp"
#include "tasknag/notify/url_opener.hpp"
#include "test_helpers.hpp"

using namespace tasknag::notify;
using tasknag::ErrorCode;

TEST(DesktopPresentationSinkTest, RunsConfiguredTools) {
  DesktopPresentationSink::Options options;
  options.notifier = "true";
  options.sound_command = "true";
  options.sound_args = {};
  options.focus_command = "true";
  DesktopPresentationSink sink(options);

  EXPECT_OK(sink.showAlert("📅 Due today", "Submit report"));
  EXPECT_OK(sink.playCue());
  EXPECT_OK(sink.bringToFront());
}

TEST(DesktopPresentationSinkTest, ReportsToolFailures) {
  DesktopPresentationSink::Options options;
  options.notifier = "false";
  options.sound_command = "tasknag-no-such-player";
  DesktopPresentationSink sink(options);

  EXPECT_ERROR(sink.showAlert("title", "body"), ErrorCode::kExternalToolError);
  EXPECT_ERROR(sink.playCue(), ErrorCode::kExternalToolError);
}

TEST(DesktopPresentationSinkTest, MissingOptionalTools) {
  DesktopPresentationSink::Options options;
  options.sound_command.clear();
  options.focus_command.clear();
  DesktopPresentationSink sink(options);

  EXPECT_ERROR(sink.playCue(), ErrorCode::kConfigError);
  EXPECT_OK(sink.bringToFront());
}

TEST(ConsolePresentationSinkTest, PrintsAlert) {
  std::ostringstream out;
  ConsolePresentationSink sink(out);

  EXPECT_OK(sink.showAlert("🔔 Recurring reminder", "Stand-up"));
  EXPECT_NE(out.str().find("🔔 Recurring reminder: Stand-up"), std::string::npos);
  EXPECT_EQ(out.str().front(), '[');
}

TEST(SystemUrlOpenerTest, ReportsExitStatus) {
  SystemUrlOpener ok_opener("true");
  EXPECT_TRUE(ok_opener.isAvailable());
  EXPECT_OK(ok_opener.open("https://example.com", std::chrono::seconds(5)));

  SystemUrlOpener failing_opener("false");
  EXPECT_ERROR(failing_opener.open("https://example.com", std::chrono::seconds(5)),
               ErrorCode::kExternalToolError);
}

TEST(SystemUrlOpenerTest, TimesOutSlowHandler) {
  // "sleep 1" stands in for a handler that never returns in time
  SystemUrlOpener slow_opener("sleep");
  auto start = std::chrono::steady_clock::now();
  EXPECT_ERROR(slow_opener.open("1", std::chrono::milliseconds(100)), ErrorCode::kTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(900));
}

TEST(SystemUrlOpenerTest, MissingCommandIsUnavailable) {
  SystemUrlOpener opener("tasknag-no-such-opener");
  EXPECT_FALSE(opener.isAvailable());
  EXPECT_ERROR(opener.open("https://example.com", std::chrono::seconds(1)),
               ErrorCode::kExternalToolError);
}
