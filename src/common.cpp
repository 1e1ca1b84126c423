#include "tasknag/common.hpp"

#include <sstream>

#ifndef TASKNAG_VERSION_MAJOR
#define TASKNAG_VERSION_MAJOR 0
#define TASKNAG_VERSION_MINOR 1
#define TASKNAG_VERSION_PATCH 0
#endif

#ifndef TASKNAG_VERSION_BUILD
#define TASKNAG_VERSION_BUILD ""
#endif

namespace tasknag {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kExternalToolError:
      return "External tool error";
    case ErrorCode::kSecurityError:
      return "Security error";
    case ErrorCode::kSystemError:
      return "System error";
    case ErrorCode::kProcessError:
      return "Process error";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInvalidState:
      return "Invalid state";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
  return Version{TASKNAG_VERSION_MAJOR, TASKNAG_VERSION_MINOR, TASKNAG_VERSION_PATCH,
                 TASKNAG_VERSION_BUILD};
}

}  // namespace tasknag
