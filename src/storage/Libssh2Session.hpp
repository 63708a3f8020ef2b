#pragma once

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <string>

#include "SftpSession.hpp"

namespace sftp {

// Translate a libssh2 return code. `sftp_error` is libssh2_sftp_last_error()
// and only matters when `rc` is LIBSSH2_ERROR_SFTP_PROTOCOL.
Status statusFromLibssh2(int rc, unsigned long sftp_error);

// File opened by Libssh2Session. Frees its handle on destruction if close()
// was never called.
class Libssh2File : public IFile {
 public:
  Libssh2File(LIBSSH2_SESSION* session, LIBSSH2_SFTP* sftp,
              LIBSSH2_SFTP_HANDLE* handle, int socket);
  virtual ~Libssh2File();

  virtual Status fstat(Attributes& out);
  virtual Status seek(off_t offset);
  virtual Status read(char* buf, std::size_t length, std::size_t& nread);
  virtual Status close();

 private:
  Libssh2File(const Libssh2File&);
  Libssh2File& operator=(const Libssh2File&);

  Status lastStatus(int rc) const;

  LIBSSH2_SESSION* session_;
  LIBSSH2_SFTP* sftp_;
  LIBSSH2_SFTP_HANDLE* handle_;
  int socket_;
};

// ISession over a libssh2 session that the caller has connected and
// authenticated on `socket`. The session is switched to non-blocking mode.
// The SFTP subsystem is started by the first open() and reused by later
// ones.
//
// Neither the session nor the socket is owned: after disconnect() the
// caller still calls libssh2_session_free() and closes the socket.
class Libssh2Session : public ISession {
 public:
  Libssh2Session(LIBSSH2_SESSION* session, int socket);
  virtual ~Libssh2Session();

  virtual Status open(const std::string& path, IFile*& out);
  virtual Status disconnect();
  virtual int socketFd() const;

 private:
  Libssh2Session(const Libssh2Session&);
  Libssh2Session& operator=(const Libssh2Session&);

  Status shutdownSftp();

  LIBSSH2_SESSION* session_;
  LIBSSH2_SFTP* sftp_;
  int socket_;
  bool disconnected_;
};

}  // namespace sftp
