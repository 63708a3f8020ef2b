#include "SftpSession.hpp"

namespace sftp {

const char* statusToString(Status status) {
  switch (status) {
    case SFTP_OK:
      return "ok";
    case SFTP_AGAIN:
      return "would block";
    case SFTP_NO_SUCH_FILE:
      return "no such file";
    case SFTP_PERMISSION_DENIED:
      return "permission denied";
    case SFTP_CONNECTION_LOST:
      return "connection lost";
    default:
      return "failure";
  }
}

}  // namespace sftp
