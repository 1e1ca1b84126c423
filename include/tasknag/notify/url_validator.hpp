#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tasknag::notify {

struct UrlValidationResult {
  bool is_valid = false;
  std::string protocol;        // "invalid" when rejected
  std::string host;
  std::string normalized_url;  // what would actually be opened
  std::optional<std::string> error;
};

struct UrlPreview {
  std::string url;
  std::string domain;
  std::string title;
};

/**
 * @brief Decides whether a URL is safe to hand to the OS URL handler
 *
 * Rules run in order: length cap, dangerous-pattern scan, parse (with
 * https:// completion for bare hosts), blocked schemes, allowed schemes,
 * host format. Results are computed per call and never cached.
 */
class UrlValidator {
 public:
  struct Options {
    size_t max_length = 2048;
    std::vector<std::string> allowed_protocols = {"http", "https"};
    std::vector<std::string> blocked_protocols = {"javascript", "data", "file", "ftp", "vbscript"};
  };

  UrlValidator();
  explicit UrlValidator(Options options);

  UrlValidationResult validate(std::string_view url) const;

  bool quickValidate(std::string_view url) const { return validate(url).is_valid; }

  /**
   * @brief Candidate fixes for a URL, for UI hinting only
   */
  std::vector<std::string> suggestCorrections(std::string_view url) const;

  /**
   * @brief Display information for a valid URL
   */
  std::optional<UrlPreview> preview(std::string_view url) const;

  const Options& options() const noexcept { return options_; }

 private:
  Options options_;
};

}  // namespace tasknag::notify
