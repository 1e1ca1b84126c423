#include "tasknag/util/filesystem.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <random>

namespace tasknag::util {

namespace {

std::filesystem::path temporarySibling(const std::filesystem::path& target) {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(100000, 999999);

  auto temp_path = target;
  temp_path += ".tmp." + std::to_string(dis(gen));
  return temp_path;
}

void removeQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

Result<void> FileSystem::writeFileAtomic(const std::filesystem::path& path,
                                         const std::string& content) {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create parent directory: " + ec.message()));
    }
  }

  auto temp_path = temporarySibling(path);
  {
    std::ofstream file(temp_path, std::ios::binary);
    if (!file) {
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Cannot create temporary file: " + temp_path.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
      removeQuietly(temp_path);
      return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                       "Failed to write temporary file: " + temp_path.string()));
    }
  }

  int fd = open(temp_path.c_str(), O_RDONLY);
  if (fd >= 0) {
    fsync(fd);
    close(fd);
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    removeQuietly(temp_path);
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot replace " + path.string() + ": " + ec.message()));
  }
  return {};
}

}  // namespace tasknag::util
