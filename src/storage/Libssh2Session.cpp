#include "Libssh2Session.hpp"

#include <poll.h>

#include <cerrno>
#include <cstring>
#include <limits>

#include "Logger.hpp"

namespace {

const int kWaitTimeoutMs = 30000;

// Wait until libssh2 can make progress on `socket`. Used by the calls that
// must finish before returning (close, shutdown, disconnect).
bool waitSocket(int socket, LIBSSH2_SESSION* session) {
  int directions = libssh2_session_block_directions(session);
  struct pollfd pfd;
  pfd.fd = socket;
  pfd.events = 0;
  pfd.revents = 0;
  if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) {
    pfd.events |= POLLIN;
  }
  if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) {
    pfd.events |= POLLOUT;
  }
  if (pfd.events == 0) {
    pfd.events = POLLIN;
  }

  int rc;
  do {
    rc = poll(&pfd, 1, kWaitTimeoutMs);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    LOG_PERROR(ERROR, "sftp: poll");
    return false;
  }
  if (rc == 0) {
    LOG(ERROR) << "sftp: no answer from the server after " << kWaitTimeoutMs
               << " ms";
    return false;
  }
  return true;
}

}  // anonymous namespace

namespace sftp {

Status statusFromLibssh2(int rc, unsigned long sftp_error) {
  if (rc >= 0) {
    return SFTP_OK;
  }
  switch (rc) {
    case LIBSSH2_ERROR_EAGAIN:
      return SFTP_AGAIN;
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
      return SFTP_CONNECTION_LOST;
    case LIBSSH2_ERROR_SFTP_PROTOCOL:
      switch (sftp_error) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
          return SFTP_NO_SUCH_FILE;
        case LIBSSH2_FX_PERMISSION_DENIED:
          return SFTP_PERMISSION_DENIED;
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
          return SFTP_CONNECTION_LOST;
        default:
          return SFTP_FAILURE;
      }
    default:
      return SFTP_FAILURE;
  }
}

Libssh2File::Libssh2File(LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp,
                         LIBSSH2_SFTP_HANDLE* handle, int socket)
    : session_(session), sftp_(sftp), handle_(handle), socket_(socket) {}

Libssh2File::~Libssh2File() {
  if (handle_ != NULL) {
    Status st = close();
    if (st != SFTP_OK) {
      LOG(ERROR) << "sftp: closing file handle: " << statusToString(st);
    }
  }
}

Status Libssh2File::lastStatus(int rc) const {
  unsigned long sftp_error =
      rc == LIBSSH2_ERROR_SFTP_PROTOCOL ? libssh2_sftp_last_error(sftp_) : 0;
  return statusFromLibssh2(rc, sftp_error);
}

Status Libssh2File::fstat(Attributes& out) {
  LIBSSH2_SFTP_ATTRIBUTES attrs;
  std::memset(&attrs, 0, sizeof(attrs));
  int rc = libssh2_sftp_fstat_ex(handle_, &attrs, 0);
  if (rc < 0) {
    return lastStatus(rc);
  }

  if (!(attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) ||
      attrs.filesize > static_cast<libssh2_uint64_t>(
                           std::numeric_limits<off_t>::max())) {
    LOG(ERROR) << "sftp: server reported no usable file size";
    return SFTP_FAILURE;
  }
  out.size = static_cast<off_t>(attrs.filesize);
  out.mtime = (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                  ? static_cast<time_t>(attrs.mtime)
                  : 0;
  out.is_directory = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
                     LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
  return SFTP_OK;
}

Status Libssh2File::seek(off_t offset) {
  if (offset < 0) {
    return SFTP_FAILURE;
  }
  libssh2_sftp_seek64(handle_, static_cast<libssh2_uint64_t>(offset));
  return SFTP_OK;
}

Status Libssh2File::read(char* buf, std::size_t length, std::size_t& nread) {
  nread = 0;
  ssize_t n = libssh2_sftp_read(handle_, buf, length);
  if (n < 0) {
    return lastStatus(static_cast<int>(n));
  }
  nread = static_cast<std::size_t>(n);
  return SFTP_OK;
}

Status Libssh2File::close() {
  if (handle_ == NULL) {
    return SFTP_OK;
  }
  int rc;
  while ((rc = libssh2_sftp_close_handle(handle_)) == LIBSSH2_ERROR_EAGAIN) {
    if (!waitSocket(socket_, session_)) {
      handle_ = NULL;
      return SFTP_CONNECTION_LOST;
    }
  }
  handle_ = NULL;
  return rc < 0 ? lastStatus(rc) : SFTP_OK;
}

Libssh2Session::Libssh2Session(LIBSSH2_SESSION* session, int socket)
    : session_(session), sftp_(NULL), socket_(socket), disconnected_(false) {
  libssh2_session_set_blocking(session_, 0);
}

Libssh2Session::~Libssh2Session() {
  if (sftp_ != NULL) {
    Status st = shutdownSftp();
    if (st != SFTP_OK) {
      LOG(ERROR) << "sftp: shutting down subsystem: " << statusToString(st);
    }
  }
}

Status Libssh2Session::open(const std::string& path, IFile*& out) {
  if (disconnected_) {
    return SFTP_CONNECTION_LOST;
  }
  if (sftp_ == NULL) {
    sftp_ = libssh2_sftp_init(session_);
    if (sftp_ == NULL) {
      return statusFromLibssh2(libssh2_session_last_errno(session_), 0);
    }
    LOG(DEBUG) << "sftp: subsystem started on fd " << socket_;
  }

  LIBSSH2_SFTP_HANDLE* handle = libssh2_sftp_open_ex(
      sftp_, path.c_str(), static_cast<unsigned int>(path.size()),
      LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
  if (handle == NULL) {
    int rc = libssh2_session_last_errno(session_);
    unsigned long sftp_error =
        rc == LIBSSH2_ERROR_SFTP_PROTOCOL ? libssh2_sftp_last_error(sftp_) : 0;
    return statusFromLibssh2(rc, sftp_error);
  }
  out = new Libssh2File(session_, sftp_, handle, socket_);
  return SFTP_OK;
}

Status Libssh2Session::shutdownSftp() {
  if (sftp_ == NULL) {
    return SFTP_OK;
  }
  int rc;
  while ((rc = libssh2_sftp_shutdown(sftp_)) == LIBSSH2_ERROR_EAGAIN) {
    if (!waitSocket(socket_, session_)) {
      sftp_ = NULL;
      return SFTP_CONNECTION_LOST;
    }
  }
  sftp_ = NULL;
  return statusFromLibssh2(rc, 0);
}

Status Libssh2Session::disconnect() {
  if (disconnected_) {
    return SFTP_OK;
  }
  disconnected_ = true;

  Status sftp_status = shutdownSftp();
  int rc;
  while ((rc = libssh2_session_disconnect(session_, "rangeserv: done")) ==
         LIBSSH2_ERROR_EAGAIN) {
    if (!waitSocket(socket_, session_)) {
      return SFTP_CONNECTION_LOST;
    }
  }
  if (sftp_status != SFTP_OK) {
    return sftp_status;
  }
  return statusFromLibssh2(rc, 0);
}

int Libssh2Session::socketFd() const {
  return socket_;
}

}  // namespace sftp
