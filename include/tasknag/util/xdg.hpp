#pragma once

#include <filesystem>
#include <string>

namespace tasknag::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG data home directory (~/.local/share/tasknag)
  static std::filesystem::path dataHome();

  // Get XDG config home directory (~/.config/tasknag)
  static std::filesystem::path configHome();

  // Ensure directory exists with proper permissions
  static bool ensureDirectory(const std::filesystem::path& path, std::filesystem::perms perms);

  // Get config file path
  static std::filesystem::path configFile();

  // Get task database path
  static std::filesystem::path databaseFile();

  // Get log directory
  static std::filesystem::path logDir();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace tasknag::util
