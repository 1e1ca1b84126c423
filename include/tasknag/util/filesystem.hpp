#pragma once

#include <filesystem>
#include <string>

#include "tasknag/common.hpp"

namespace tasknag::util {

// File system helpers
class FileSystem {
 public:
  // Write content to a temporary sibling, fsync it and rename over the target
  static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                      const std::string& content);
};

}  // namespace tasknag::util
