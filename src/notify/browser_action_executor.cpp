#include "tasknag/notify/browser_action_executor.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace tasknag::notify {

BrowserActionExecutor::BrowserActionExecutor(UrlOpener& opener, const UrlValidator& validator,
                                             util::Clock& clock)
    : BrowserActionExecutor(opener, validator, clock, Options{}) {}

BrowserActionExecutor::BrowserActionExecutor(UrlOpener& opener, const UrlValidator& validator,
                                             util::Clock& clock, Options options)
    : opener_(opener), validator_(validator), clock_(clock), options_(options) {}

void BrowserActionExecutor::run(const std::vector<core::BrowserAction>& actions) {
  std::vector<core::BrowserAction> ordered = actions;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const core::BrowserAction& a, const core::BrowserAction& b) {
                     return a.order < b.order;
                   });

  size_t opened = 0;
  size_t failed = 0;
  size_t skipped = 0;
  bool first_attempt = true;

  for (const auto& action : ordered) {
    if (!action.enabled) {
      continue;
    }

    auto validation = validator_.validate(action.url);
    if (!validation.is_valid) {
      spdlog::warn("Skipping browser action '{}' ({}): {}", action.label, action.url,
                   validation.error.value_or("invalid URL"));
      ++skipped;
      continue;
    }

    if (!first_attempt && options_.pacing.count() > 0) {
      clock_.sleepFor(options_.pacing);
    }
    first_attempt = false;

    auto result = opener_.open(validation.normalized_url, options_.open_timeout);
    if (!result) {
      spdlog::warn("Browser action '{}' failed to open {}: {}", action.label,
                   validation.normalized_url, result.error().message());
      ++failed;
      continue;
    }

    spdlog::info("Opened browser action '{}': {}", action.label, validation.normalized_url);
    ++opened;
  }

  spdlog::debug("Browser actions finished: {} opened, {} failed, {} skipped", opened, failed, skipped);
}

Result<void> BrowserActionExecutor::runOne(const core::BrowserAction& action) {
  if (!action.enabled) {
    spdlog::debug("Browser action '{}' is disabled", action.label);
    return {};
  }

  auto validation = validator_.validate(action.url);
  if (!validation.is_valid) {
    return std::unexpected(makeError(ErrorCode::kSecurityError,
                                     "Invalid URL for action '" + action.label + "': " +
                                     validation.error.value_or("rejected")));
  }

  return openValidated(validation.normalized_url);
}

Result<void> BrowserActionExecutor::testUrl(const std::string& url) {
  auto validation = validator_.validate(url);
  if (!validation.is_valid) {
    return std::unexpected(makeError(ErrorCode::kSecurityError,
                                     validation.error.value_or("URL rejected")));
  }
  return openValidated(validation.normalized_url);
}

Result<void> BrowserActionExecutor::openValidated(const std::string& url) {
  auto result = opener_.open(url, options_.open_timeout);
  if (!result) {
    spdlog::warn("Failed to open {}: {}", url, result.error().message());
    return result;
  }
  spdlog::info("Opened {}", url);
  return {};
}

}  // namespace tasknag::notify
