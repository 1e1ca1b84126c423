#pragma once

#include <filesystem>

#include "tasknag/common.hpp"

namespace tasknag::util {

/**
 * @brief Exclusive advisory lock (flock) on a file, held until destruction
 *
 * Locks belong to the open file description, so two FileLock objects on the
 * same path exclude each other within one process as well as across
 * processes.
 */
class FileLock {
 public:
  // Blocks until the lock is granted; creates the file if needed
  static Result<FileLock> acquire(const std::filesystem::path& path);

  // Fails with kInvalidState when someone else holds the lock
  static Result<FileLock> tryAcquire(const std::filesystem::path& path);

  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;
  ~FileLock();

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  FileLock(int fd, std::filesystem::path path);

  static Result<FileLock> lock(const std::filesystem::path& path, bool wait);
  void release() noexcept;

  int fd_ = -1;
  std::filesystem::path path_;
};

}  // namespace tasknag::util
