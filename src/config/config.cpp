#include "tasknag/config/config.hpp"

#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

#include "tasknag/util/filesystem.hpp"
#include "tasknag/util/xdg.hpp"

namespace tasknag::config {

namespace {

const std::vector<std::string> kKeys = {
    "scheduler.interval_minutes",
    "scheduler.tolerance_minutes",
    "scheduler.align_to_boundary",
    "browser.open_timeout_ms",
    "browser.pacing_ms",
    "browser.opener",
    "url.max_length",
    "url.allowed_protocols",
    "url.blocked_protocols",
    "alert.app_name",
    "alert.notifier",
    "alert.sound_command",
    "alert.sound_args",
    "alert.focus_command",
    "alert.focus_args",
    "storage.database",
    "logging.level",
    "logging.file",
    "logging.max_size_mb",
    "logging.max_files",
};

Result<int> parseInt(const std::string& key, const std::string& value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Invalid integer for " + key + ": " + value));
    }
    return parsed;
  } catch (const std::exception&) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid integer for " + key + ": " + value));
  }
}

Result<bool> parseBool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Invalid boolean for " + key + ": " + value));
}

// Lists are exchanged as comma separated strings on the command line
std::string joinList(const std::vector<std::string>& items) {
  std::string joined;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) joined += ",";
    joined += items[i];
  }
  return joined;
}

std::vector<std::string> splitList(const std::string& value) {
  std::vector<std::string> items;
  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    auto start = item.find_first_not_of(" \t");
    auto end = item.find_last_not_of(" \t");
    if (start != std::string::npos) {
      items.push_back(item.substr(start, end - start + 1));
    }
  }
  return items;
}

std::vector<std::string> readStringArray(const toml::array& array) {
  std::vector<std::string> items;
  for (const auto& element : array) {
    if (auto value = element.value<std::string>()) {
      items.push_back(*value);
    }
  }
  return items;
}

toml::array toStringArray(const std::vector<std::string>& items) {
  toml::array array;
  for (const auto& item : items) {
    array.push_back(item);
  }
  return array;
}

}  // namespace

Config::Config() {
  applyDefaults();
}

void Config::applyDefaults() {
  config_path_ = defaultConfigPath();
  storage.database = tasknag::util::Xdg::databaseFile();
  logging.file = tasknag::util::Xdg::logDir() / "tasknag.log";
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto table = config_data["scheduler"].as_table()) {
      if (auto value = (*table)["interval_minutes"].value<int64_t>()) {
        scheduler.interval_minutes = static_cast<int>(*value);
      }
      if (auto value = (*table)["tolerance_minutes"].value<int64_t>()) {
        scheduler.tolerance_minutes = static_cast<int>(*value);
      }
      if (auto value = (*table)["align_to_boundary"].value<bool>()) {
        scheduler.align_to_boundary = *value;
      }
    }

    if (auto table = config_data["browser"].as_table()) {
      if (auto value = (*table)["open_timeout_ms"].value<int64_t>()) {
        browser.open_timeout_ms = static_cast<int>(*value);
      }
      if (auto value = (*table)["pacing_ms"].value<int64_t>()) {
        browser.pacing_ms = static_cast<int>(*value);
      }
      if (auto value = (*table)["opener"].value<std::string>()) {
        browser.opener = *value;
      }
    }

    if (auto table = config_data["url"].as_table()) {
      if (auto value = (*table)["max_length"].value<int64_t>()) {
        if (*value <= 0) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "url.max_length must be positive, got " +
                                           std::to_string(*value)));
        }
        url.max_length = static_cast<size_t>(*value);
      }
      if (auto array = (*table)["allowed_protocols"].as_array()) {
        url.allowed_protocols = readStringArray(*array);
      }
      if (auto array = (*table)["blocked_protocols"].as_array()) {
        url.blocked_protocols = readStringArray(*array);
      }
    }

    if (auto table = config_data["alert"].as_table()) {
      if (auto value = (*table)["app_name"].value<std::string>()) {
        alert.app_name = *value;
      }
      if (auto value = (*table)["notifier"].value<std::string>()) {
        alert.notifier = *value;
      }
      if (auto value = (*table)["sound_command"].value<std::string>()) {
        alert.sound_command = *value;
      }
      if (auto array = (*table)["sound_args"].as_array()) {
        alert.sound_args = readStringArray(*array);
      }
      if (auto value = (*table)["focus_command"].value<std::string>()) {
        alert.focus_command = *value;
      }
      if (auto array = (*table)["focus_args"].as_array()) {
        alert.focus_args = readStringArray(*array);
      }
    }

    if (auto table = config_data["storage"].as_table()) {
      if (auto value = (*table)["database"].value<std::string>()) {
        storage.database = resolveEnvVar(*value);
      }
    }

    if (auto table = config_data["logging"].as_table()) {
      if (auto value = (*table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*table)["file"].value<std::string>()) {
        logging.file = resolveEnvVar(*value);
      }
      if (auto value = (*table)["max_size_mb"].value<int64_t>()) {
        logging.max_size_mb = static_cast<int>(*value);
      }
      if (auto value = (*table)["max_files"].value<int64_t>()) {
        logging.max_files = static_cast<int>(*value);
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Config parse error: " + std::string(e.description())));
  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config load error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    auto scheduler_table = toml::table{};
    scheduler_table.insert_or_assign("interval_minutes", scheduler.interval_minutes);
    scheduler_table.insert_or_assign("tolerance_minutes", scheduler.tolerance_minutes);
    scheduler_table.insert_or_assign("align_to_boundary", scheduler.align_to_boundary);
    config_data.insert_or_assign("scheduler", scheduler_table);

    auto browser_table = toml::table{};
    browser_table.insert_or_assign("open_timeout_ms", browser.open_timeout_ms);
    browser_table.insert_or_assign("pacing_ms", browser.pacing_ms);
    browser_table.insert_or_assign("opener", browser.opener);
    config_data.insert_or_assign("browser", browser_table);

    auto url_table = toml::table{};
    url_table.insert_or_assign("max_length", static_cast<int64_t>(url.max_length));
    url_table.insert_or_assign("allowed_protocols", toStringArray(url.allowed_protocols));
    url_table.insert_or_assign("blocked_protocols", toStringArray(url.blocked_protocols));
    config_data.insert_or_assign("url", url_table);

    auto alert_table = toml::table{};
    alert_table.insert_or_assign("app_name", alert.app_name);
    alert_table.insert_or_assign("notifier", alert.notifier);
    alert_table.insert_or_assign("sound_command", alert.sound_command);
    alert_table.insert_or_assign("sound_args", toStringArray(alert.sound_args));
    alert_table.insert_or_assign("focus_command", alert.focus_command);
    alert_table.insert_or_assign("focus_args", toStringArray(alert.focus_args));
    config_data.insert_or_assign("alert", alert_table);

    auto storage_table = toml::table{};
    storage_table.insert_or_assign("database", storage.database.string());
    config_data.insert_or_assign("storage", storage_table);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    logging_table.insert_or_assign("file", logging.file.string());
    logging_table.insert_or_assign("max_size_mb", logging.max_size_mb);
    logging_table.insert_or_assign("max_files", logging.max_files);
    config_data.insert_or_assign("logging", logging_table);

    std::stringstream ss;
    ss << config_data;
    auto write_result = tasknag::util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

std::vector<std::string> Config::keys() {
  return kKeys;
}

Result<void> Config::validate() const {
  if (scheduler.interval_minutes <= 0 || 1440 % scheduler.interval_minutes != 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "scheduler.interval_minutes must be a positive divisor of 1440, got " +
                                     std::to_string(scheduler.interval_minutes)));
  }

  // A tolerance below the interval would let a reminder slip between two wakes
  if (scheduler.tolerance_minutes < scheduler.interval_minutes) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "scheduler.tolerance_minutes (" +
                                     std::to_string(scheduler.tolerance_minutes) +
                                     ") must not be smaller than scheduler.interval_minutes (" +
                                     std::to_string(scheduler.interval_minutes) + ")"));
  }

  if (browser.open_timeout_ms <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "browser.open_timeout_ms must be positive"));
  }

  if (browser.pacing_ms < 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "browser.pacing_ms must not be negative"));
  }

  if (url.max_length == 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "url.max_length must be positive"));
  }

  if (url.allowed_protocols.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "url.allowed_protocols must not be empty"));
  }

  for (const auto& protocol : url.allowed_protocols) {
    for (const auto& blocked : url.blocked_protocols) {
      if (protocol == blocked) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Protocol is both allowed and blocked: " + protocol));
      }
    }
  }

  if (alert.notifier.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "alert.notifier must be set"));
  }

  if (logging.max_size_mb <= 0 || logging.max_files <= 0) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "logging.max_size_mb and logging.max_files must be positive"));
  }

  return {};
}

std::filesystem::path Config::defaultConfigPath() {
  return tasknag::util::Xdg::configFile();
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 2) {
    const std::string& section = path[0];
    const std::string& key = path[1];

    if (section == "scheduler") {
      if (key == "interval_minutes") return std::to_string(scheduler.interval_minutes);
      if (key == "tolerance_minutes") return std::to_string(scheduler.tolerance_minutes);
      if (key == "align_to_boundary") return std::string(scheduler.align_to_boundary ? "true" : "false");
    } else if (section == "browser") {
      if (key == "open_timeout_ms") return std::to_string(browser.open_timeout_ms);
      if (key == "pacing_ms") return std::to_string(browser.pacing_ms);
      if (key == "opener") return browser.opener;
    } else if (section == "url") {
      if (key == "max_length") return std::to_string(url.max_length);
      if (key == "allowed_protocols") return joinList(url.allowed_protocols);
      if (key == "blocked_protocols") return joinList(url.blocked_protocols);
    } else if (section == "alert") {
      if (key == "app_name") return alert.app_name;
      if (key == "notifier") return alert.notifier;
      if (key == "sound_command") return alert.sound_command;
      if (key == "sound_args") return joinList(alert.sound_args);
      if (key == "focus_command") return alert.focus_command;
      if (key == "focus_args") return joinList(alert.focus_args);
    } else if (section == "storage") {
      if (key == "database") return storage.database.string();
    } else if (section == "logging") {
      if (key == "level") return logging.level;
      if (key == "file") return logging.file.string();
      if (key == "max_size_mb") return std::to_string(logging.max_size_mb);
      if (key == "max_files") return std::to_string(logging.max_files);
    }
  }

  std::string joined;
  for (const auto& part : path) {
    if (!joined.empty()) joined += ".";
    joined += part;
  }
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + joined));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  auto assignInt = [&](int& target) -> Result<void> {
    auto parsed = parseInt(path[0] + "." + path[1], value);
    if (!parsed) return std::unexpected(parsed.error());
    target = *parsed;
    return {};
  };

  if (path.size() == 2) {
    const std::string& section = path[0];
    const std::string& key = path[1];

    if (section == "scheduler") {
      if (key == "interval_minutes") return assignInt(scheduler.interval_minutes);
      if (key == "tolerance_minutes") return assignInt(scheduler.tolerance_minutes);
      if (key == "align_to_boundary") {
        auto parsed = parseBool(section + "." + key, value);
        if (!parsed) return std::unexpected(parsed.error());
        scheduler.align_to_boundary = *parsed;
        return {};
      }
    } else if (section == "browser") {
      if (key == "open_timeout_ms") return assignInt(browser.open_timeout_ms);
      if (key == "pacing_ms") return assignInt(browser.pacing_ms);
      if (key == "opener") { browser.opener = value; return {}; }
    } else if (section == "url") {
      if (key == "max_length") {
        int length = 0;
        auto result = assignInt(length);
        if (!result) return result;
        if (length <= 0) {
          return std::unexpected(makeError(ErrorCode::kConfigError,
                                           "url.max_length must be positive"));
        }
        url.max_length = static_cast<size_t>(length);
        return {};
      }
      if (key == "allowed_protocols") { url.allowed_protocols = splitList(value); return {}; }
      if (key == "blocked_protocols") { url.blocked_protocols = splitList(value); return {}; }
    } else if (section == "alert") {
      if (key == "app_name") { alert.app_name = value; return {}; }
      if (key == "notifier") { alert.notifier = value; return {}; }
      if (key == "sound_command") { alert.sound_command = value; return {}; }
      if (key == "sound_args") { alert.sound_args = splitList(value); return {}; }
      if (key == "focus_command") { alert.focus_command = value; return {}; }
      if (key == "focus_args") { alert.focus_args = splitList(value); return {}; }
    } else if (section == "storage") {
      if (key == "database") { storage.database = value; return {}; }
    } else if (section == "logging") {
      if (key == "level") { logging.level = value; return {}; }
      if (key == "file") { logging.file = value; return {}; }
      if (key == "max_size_mb") return assignInt(logging.max_size_mb);
      if (key == "max_files") return assignInt(logging.max_files);
    }
  }

  std::string joined;
  for (const auto& part : path) {
    if (!joined.empty()) joined += ".";
    joined += part;
  }
  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + joined));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace tasknag::config
