#pragma once

#include <string>

#include "BackendError.hpp"
#include "IStorageBackend.hpp"
#include "SftpSession.hpp"

// Who disconnects the SFTP session once the response is finished.
enum SessionOwnership {
  BORROW_SESSION,  // the caller keeps using the session afterwards
  OWN_SESSION      // the response disconnects it when the file is closed
};

// Backend over a file on an already connected SFTP session. Never blocks:
// operations return IO_WOULD_BLOCK while the session socket is not ready.
class RemoteBackend : public IStorageBackend {
 public:
  RemoteBackend(sftp::ISession& session, const std::string& path,
                SessionOwnership ownership);
  virtual ~RemoteBackend();

  virtual IoResult stat(ResourceDescriptor& out);
  virtual IoResult readAt(off_t offset, std::size_t length, std::string& out);
  virtual void close();
  virtual int getMonitorFd() const;
  virtual std::string path() const;

  SessionOwnership ownership() const;

 private:
  RemoteBackend(const RemoteBackend&);
  RemoteBackend& operator=(const RemoteBackend&);

  void seekTo(off_t offset);
  BackendError statusError(sftp::Status status, const std::string& what) const;

  sftp::ISession& session_;
  std::string path_;
  SessionOwnership ownership_;
  sftp::IFile* file_;
  off_t position_;
  // Bytes gathered by a readAt() that was interrupted by SFTP_AGAIN
  std::string pending_;
  off_t pending_offset_;
  std::size_t pending_length_;
};
