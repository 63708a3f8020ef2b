#include "LocalBackend.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "BackendError.hpp"
#include "Logger.hpp"

namespace {

BackendError errnoError(const std::string& what, const std::string& path) {
  int err = errno;
  return BackendError(BackendError::kindFromErrno(err),
                      what + " '" + path + "': " + std::strerror(err));
}

}  // anonymous namespace

LocalBackend::LocalBackend(const std::string& path) : path_(path), fd_(-1) {}

LocalBackend::~LocalBackend() {
  // StorageHandle normally closed us already
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

IoResult LocalBackend::stat(ResourceDescriptor& out) {
  if (fd_ < 0) {
    fd_ = open(path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
      throw errnoError("open", path_);
    }
    LOG(DEBUG) << "storage: opened '" << path_ << "' fd=" << fd_;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    throw errnoError("fstat", path_);
  }
  if (S_ISDIR(st.st_mode)) {
    throw BackendError(BackendError::BE_IS_DIRECTORY,
                       "'" + path_ + "' is a directory");
  }
  out = ResourceDescriptor::fromStat(st.st_size, st.st_mtime);
  return IO_DONE;
}

IoResult LocalBackend::readAt(off_t offset, std::size_t length,
                              std::string& out) {
  if (fd_ < 0) {
    throw BackendError(BackendError::BE_OTHER,
                       "read from unopened file '" + path_ + "'");
  }

  out.resize(length);
  std::size_t total = 0;
  while (total < length) {
    ssize_t n = pread(fd_, &out[total], length - total,
                      offset + static_cast<off_t>(total));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw errnoError("pread", path_);
    }
    if (n == 0) {
      break;  // EOF
    }
    total += static_cast<std::size_t>(n);
  }
  out.resize(total);
  return IO_DONE;
}

void LocalBackend::close() {
  if (fd_ < 0) {
    return;
  }
  int fd = fd_;
  fd_ = -1;
  LOG(DEBUG) << "storage: closing fd=" << fd;
  if (::close(fd) < 0) {
    throw errnoError("close", path_);
  }
}

std::string LocalBackend::path() const {
  return path_;
}
