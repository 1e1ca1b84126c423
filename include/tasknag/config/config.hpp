#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tasknag/common.hpp"

namespace tasknag::config {

// Configuration for the tasknag notification engine
class Config {
 public:
  // Built-in defaults; call load() to overlay a config file
  Config();

  // Periodic sweep configuration
  struct SchedulerConfig {
    int interval_minutes = 15;    // Sweep period, must divide a day
    int tolerance_minutes = 15;   // Fire window, never below the interval
    bool align_to_boundary = true; // Wake on :00/:15/:30/:45 instead of "now + interval"
  };
  SchedulerConfig scheduler;

  // Browser action launching
  struct BrowserConfig {
    int open_timeout_ms = 3000;   // Hard limit per URL launch
    int pacing_ms = 500;          // Delay between successive launches
    std::string opener;           // Empty = platform default (xdg-open/open)
  };
  BrowserConfig browser;

  // URL validation policy
  struct UrlConfig {
    size_t max_length = 2048;
    std::vector<std::string> allowed_protocols = {"http", "https"};
    std::vector<std::string> blocked_protocols = {"javascript", "data", "file", "ftp", "vbscript"};
  };
  UrlConfig url;

  // Desktop presentation
  struct AlertConfig {
    std::string app_name = "TaskNag";
    std::string notifier = "notify-send";
    std::string sound_command = "canberra-gtk-play";
    std::vector<std::string> sound_args = {"-i", "message-new-instant"};
    std::string focus_command;              // e.g. "wmctrl"
    std::vector<std::string> focus_args;    // e.g. ["-a", "TaskNag"]
  };
  AlertConfig alert;

  // Task storage
  struct StorageConfig {
    std::filesystem::path database;
  };
  StorageConfig storage;

  // Logging
  struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
    int max_size_mb = 5;
    int max_files = 3;
  };
  LoggingConfig logging;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // All known keys in dot notation, in file order
  static std::vector<std::string> keys();

  // Validate configuration
  Result<void> validate() const;

  // Path this configuration was loaded from (or will be saved to)
  const std::filesystem::path& path() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // Environment variable resolution ("env:NAME")
  std::string resolveEnvVar(const std::string& value) const;

 private:
  std::filesystem::path config_path_;

  void applyDefaults();

  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace tasknag::config
