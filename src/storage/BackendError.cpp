#include "BackendError.hpp"

#include <cerrno>

BackendError::BackendError(Kind kind, const std::string& detail)
    : std::runtime_error(detail), kind_(kind) {}

BackendError::Kind BackendError::kind() const {
  return kind_;
}

BackendError::Kind BackendError::kindFromErrno(int err) {
  switch (err) {
    case ENOENT:
    case ENOTDIR:
      return BE_NOT_FOUND;
    case EACCES:
    case EPERM:
      return BE_PERMISSION_DENIED;
    case EISDIR:
      return BE_IS_DIRECTORY;
    case EPIPE:
    case ECONNRESET:
    case ECONNABORTED:
    case ENOTCONN:
    case ETIMEDOUT:
      return BE_CONNECTION_LOST;
    default:
      return BE_OTHER;
  }
}

const char* BackendError::kindName(Kind kind) {
  switch (kind) {
    case BE_NOT_FOUND:
      return "not found";
    case BE_PERMISSION_DENIED:
      return "permission denied";
    case BE_CONNECTION_LOST:
      return "connection lost";
    case BE_IS_DIRECTORY:
      return "is a directory";
    default:
      return "other";
  }
}
