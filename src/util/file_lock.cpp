#include "tasknag/util/file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

namespace tasknag::util {

Result<FileLock> FileLock::acquire(const std::filesystem::path& path) {
  return lock(path, true);
}

Result<FileLock> FileLock::tryAcquire(const std::filesystem::path& path) {
  return lock(path, false);
}

Result<FileLock> FileLock::lock(const std::filesystem::path& path, bool wait) {
  auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return std::unexpected(makeError(ErrorCode::kDirectoryCreateError,
                                       "Cannot create lock directory: " + ec.message()));
    }
  }

  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    return std::unexpected(makeError(ErrorCode::kFileWriteError,
                                     "Cannot open lock file " + path.string() + ": " +
                                     std::strerror(errno)));
  }

  int operation = wait ? LOCK_EX : (LOCK_EX | LOCK_NB);
  int rc;
  do {
    rc = flock(fd, operation);
  } while (rc != 0 && errno == EINTR);

  if (rc != 0) {
    int error = errno;
    close(fd);
    if (error == EWOULDBLOCK) {
      return std::unexpected(makeError(ErrorCode::kInvalidState,
                                       "Lock is held elsewhere: " + path.string()));
    }
    return std::unexpected(makeError(ErrorCode::kSystemError,
                                     "Cannot lock " + path.string() + ": " + std::strerror(error)));
  }

  return FileLock(fd, path);
}

FileLock::FileLock(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

FileLock::FileLock(FileLock&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), path_(std::move(other.path_)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    release();
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

FileLock::~FileLock() {
  release();
}

void FileLock::release() noexcept {
  if (fd_ >= 0) {
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
  }
}

}  // namespace tasknag::util
