#include "tasknag/notify/url_validator.hpp"

#include <algorithm>
#include <cctype>
#include <expected>
#include <memory>
#include <regex>

#include <curl/curl.h>

namespace tasknag::notify {

namespace {

constexpr std::string_view kDangerousPatterns[] = {"javascript:", "data:", "vbscript:", "<script"};

// Schemes whose URLs always carry a host
constexpr std::string_view kSpecialSchemes[] = {"http", "https", "ws", "wss", "ftp", "file"};

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string remainder;  // path, query and fragment
  bool has_authority = false;

  std::string serialize() const {
    if (!has_authority) {
      return scheme + ":" + remainder;
    }
    std::string url = scheme + "://" + host;
    if (!port.empty()) {
      url += ":" + port;
    }
    return url + remainder;
  }
};

std::string toLower(std::string_view str) {
  std::string lower(str);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

std::string_view trim(std::string_view str) {
  auto is_space = [](char c) { return static_cast<unsigned char>(c) <= 0x20; };
  while (!str.empty() && is_space(str.front())) str.remove_prefix(1);
  while (!str.empty() && is_space(str.back())) str.remove_suffix(1);
  return str;
}

bool isSpecialScheme(std::string_view scheme) {
  return std::find(std::begin(kSpecialSchemes), std::end(kSpecialSchemes), scheme) !=
         std::end(kSpecialSchemes);
}

struct CurlUrlDeleter {
  void operator()(CURLU* handle) const { curl_url_cleanup(handle); }
};

using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

// One component of a parsed URL, or the libcurl error code when it is absent
std::expected<std::string, CURLUcode> urlPart(CURLU* handle, CURLUPart part, unsigned int flags = 0) {
  char* value = nullptr;
  CURLUcode rc = curl_url_get(handle, part, &value, flags);
  if (rc != CURLUE_OK) {
    return std::unexpected(rc);
  }
  std::string result = value ? value : "";
  curl_free(value);
  return result;
}

std::optional<std::string_view> schemeOf(std::string_view input) {
  auto colon = input.find(':');
  if (colon == std::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  std::string_view scheme = input.substr(0, colon);
  if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) {
    return std::nullopt;
  }
  for (char c : scheme) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return std::nullopt;
    }
  }
  return scheme;
}

// Special-scheme input in the shape libcurl expects: backslashes before the
// query act as path separators and "https:host" gains its missing slashes
std::string canonicalSpecialUrl(const std::string& scheme, std::string_view rest) {
  std::string body(rest);
  auto query_start = body.find_first_of("?#");
  std::replace(body.begin(),
               query_start == std::string::npos ? body.end() : body.begin() + query_start,
               '\\', '/');

  if (scheme == "file") {
    return scheme + ":" + body;
  }
  auto first = body.find_first_not_of('/');
  return scheme + "://" + (first == std::string::npos ? std::string() : body.substr(first));
}

// Parses with libcurl's URL API; stores the failure reason on error
std::optional<ParsedUrl> parseUrl(std::string_view input, std::string& reason) {
  input = trim(input);

  auto scheme = schemeOf(input);
  if (!scheme) {
    reason = "relative URL without a base";
    return std::nullopt;
  }

  ParsedUrl parsed;
  parsed.scheme = toLower(*scheme);
  std::string_view rest = input.substr(scheme->size() + 1);

  if (!isSpecialScheme(parsed.scheme)) {
    parsed.remainder = std::string(rest);
    return parsed;
  }

  CurlUrlHandle handle(curl_url());
  if (!handle) {
    reason = "out of memory";
    return std::nullopt;
  }

  auto canonical = canonicalSpecialUrl(parsed.scheme, rest);
  CURLUcode rc = curl_url_set(handle.get(), CURLUPART_URL, canonical.c_str(), CURLU_NON_SUPPORT_SCHEME);
  if (rc != CURLUE_OK) {
    reason = curl_url_strerror(rc);
    return std::nullopt;
  }

  parsed.has_authority = true;

  // Internationalized hosts are carried in their ASCII (punycode) form
  auto host = urlPart(handle.get(), CURLUPART_HOST, CURLU_PUNYCODE);
  if (host) {
    parsed.host = toLower(*host);
  } else if (host.error() != CURLUE_NO_HOST) {
    reason = curl_url_strerror(host.error());
    return std::nullopt;
  }

  if (parsed.host.empty() && parsed.scheme != "file") {
    reason = "empty host";
    return std::nullopt;
  }

  if (auto port = urlPart(handle.get(), CURLUPART_PORT, CURLU_NO_DEFAULT_PORT)) {
    parsed.port = *port;
  }

  auto path = urlPart(handle.get(), CURLUPART_PATH).value_or("/");
  auto query = urlPart(handle.get(), CURLUPART_QUERY);
  auto fragment = urlPart(handle.get(), CURLUPART_FRAGMENT);
  if (path != "/" || query || fragment) {
    parsed.remainder = path;
  }
  if (query) {
    parsed.remainder += "?" + *query;
  }
  if (fragment) {
    parsed.remainder += "#" + *fragment;
  }
  return parsed;
}

UrlValidationResult reject(std::string reason) {
  UrlValidationResult result;
  result.is_valid = false;
  result.protocol = "invalid";
  result.error = std::move(reason);
  return result;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

bool isValidHost(const std::string& host, bool bare_fragment) {
  if (host == "localhost" || host.starts_with("127.") || host.starts_with("192.168.")) {
    return true;
  }

  if (host.find('.') == std::string::npos) {
    // "google" typed without scheme or TLD is accepted as a bare host fragment
    static const std::regex label_regex(R"(^[a-zA-Z0-9-]+$)");
    return bare_fragment && std::regex_match(host, label_regex);
  }

  static const std::regex domain_regex(R"(^[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
  return std::regex_match(host, domain_regex);
}

}  // namespace

UrlValidator::UrlValidator() = default;

UrlValidator::UrlValidator(Options options) : options_(std::move(options)) {}

UrlValidationResult UrlValidator::validate(std::string_view url) const {
  if (url.size() > options_.max_length) {
    return reject("URL too long: " + std::to_string(url.size()) + " characters (max: " +
                  std::to_string(options_.max_length) + ")");
  }

  std::string lower = toLower(url);
  for (auto pattern : kDangerousPatterns) {
    if (lower.find(pattern) != std::string::npos) {
      return reject("URL contains dangerous patterns");
    }
  }

  std::string reason;
  bool auto_completed = false;
  auto parsed = parseUrl(url, reason);
  if (!parsed && url.find("://") == std::string_view::npos) {
    parsed = parseUrl("https://" + std::string(trim(url)), reason);
    auto_completed = true;
  }
  if (!parsed) {
    return reject("Invalid URL format: " + reason);
  }

  if (contains(options_.blocked_protocols, parsed->scheme)) {
    return reject("Blocked protocol: " + parsed->scheme);
  }

  if (!contains(options_.allowed_protocols, parsed->scheme)) {
    return reject("Protocol not allowed: " + parsed->scheme);
  }

  if (!parsed->has_authority || parsed->host.empty()) {
    return reject("No host found in URL");
  }

  if (!isValidHost(parsed->host, auto_completed)) {
    return reject("Invalid host format: " + parsed->host);
  }

  UrlValidationResult result;
  result.is_valid = true;
  result.protocol = parsed->scheme;
  result.host = parsed->host;
  result.normalized_url = parsed->serialize();
  return result;
}

std::vector<std::string> UrlValidator::suggestCorrections(std::string_view url) const {
  static constexpr std::string_view kCommonDomains[] = {"google", "github", "youtube", "amazon"};

  std::vector<std::string> suggestions;
  auto add = [&suggestions](std::string candidate) {
    if (std::find(suggestions.begin(), suggestions.end(), candidate) == suggestions.end()) {
      suggestions.push_back(std::move(candidate));
    }
  };

  std::string input(trim(url));
  if (input.empty()) {
    return suggestions;
  }

  if (input.find("://") == std::string::npos) {
    add("https://" + input);
  }

  if (input.starts_with("http://")) {
    add("https://" + input.substr(7));
  }

  for (auto domain : kCommonDomains) {
    auto pos = input.find(domain);
    if (pos == std::string::npos) {
      continue;
    }
    auto after = pos + domain.size();
    if (after < input.size() && input[after] == '.') {
      continue;
    }
    std::string completed = input;
    completed.insert(after, ".com");
    add(completed);
  }

  return suggestions;
}

std::optional<UrlPreview> UrlValidator::preview(std::string_view url) const {
  auto result = validate(url);
  if (!result.is_valid) {
    return std::nullopt;
  }
  UrlPreview preview;
  preview.url = result.normalized_url;
  preview.domain = result.host;
  preview.title = "Open " + result.host;
  return preview;
}

}  // namespace tasknag::notify
