#pragma once

#include <sys/types.h>

#include <cstddef>
#include <ctime>
#include <string>

// Non-blocking SFTP session as supplied by the caller. The caller connects
// and authenticates; rangeserv only opens, reads and closes one file on it.
//
// Every call that talks to the server may return SFTP_AGAIN when the socket
// is not ready. The call must then be repeated with the same arguments once
// socketFd() is readable; nothing has been consumed in the meantime.
namespace sftp {

enum Status {
  SFTP_OK = 0,
  SFTP_AGAIN,
  SFTP_NO_SUCH_FILE,
  SFTP_PERMISSION_DENIED,
  SFTP_CONNECTION_LOST,
  SFTP_FAILURE
};

struct Attributes {
  Attributes() : size(0), mtime(0), is_directory(false) {}

  off_t size;
  time_t mtime;
  bool is_directory;
};

class IFile {
 public:
  virtual ~IFile() {}

  virtual Status fstat(Attributes& out) = 0;
  // Local only, never blocks: position of the next read
  virtual Status seek(off_t offset) = 0;
  // Read at most `length` bytes; `nread` == 0 with SFTP_OK means EOF
  virtual Status read(char* buf, std::size_t length, std::size_t& nread) = 0;
  // Blocks until the server acknowledged the close
  virtual Status close() = 0;
};

class ISession {
 public:
  virtual ~ISession() {}

  // On SFTP_OK `out` is a new file owned by the caller, who closes and
  // deletes it.
  virtual Status open(const std::string& path, IFile*& out) = 0;
  // Blocks until the transport is shut down
  virtual Status disconnect() = 0;
  virtual int socketFd() const = 0;
};

const char* statusToString(Status status);

}  // namespace sftp
