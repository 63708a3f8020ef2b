#include "RemoteBackend.hpp"

#include "BackendError.hpp"
#include "Logger.hpp"

namespace {

BackendError::Kind kindFromStatus(sftp::Status status) {
  switch (status) {
    case sftp::SFTP_NO_SUCH_FILE:
      return BackendError::BE_NOT_FOUND;
    case sftp::SFTP_PERMISSION_DENIED:
      return BackendError::BE_PERMISSION_DENIED;
    case sftp::SFTP_CONNECTION_LOST:
      return BackendError::BE_CONNECTION_LOST;
    default:
      return BackendError::BE_OTHER;
  }
}

}  // anonymous namespace

RemoteBackend::RemoteBackend(sftp::ISession& session, const std::string& path,
                             SessionOwnership ownership)
    : session_(session),
      path_(path),
      ownership_(ownership),
      file_(NULL),
      position_(-1),
      pending_(),
      pending_offset_(-1),
      pending_length_(0) {}

RemoteBackend::~RemoteBackend() {
  // close() was skipped; the file object releases its own handle
  delete file_;
}

BackendError RemoteBackend::statusError(sftp::Status status,
                                        const std::string& what) const {
  return BackendError(kindFromStatus(status), "sftp " + what + " '" + path_ +
                                                  "': " +
                                                  sftp::statusToString(status));
}

IoResult RemoteBackend::stat(ResourceDescriptor& out) {
  if (file_ == NULL) {
    sftp::IFile* opened = NULL;
    sftp::Status st = session_.open(path_, opened);
    if (st == sftp::SFTP_AGAIN) {
      return IO_WOULD_BLOCK;
    }
    if (st != sftp::SFTP_OK) {
      throw statusError(st, "open");
    }
    file_ = opened;
    position_ = 0;
    LOG(DEBUG) << "storage: opened remote '" << path_ << "'";
  }

  sftp::Attributes attrs;
  sftp::Status st = file_->fstat(attrs);
  if (st == sftp::SFTP_AGAIN) {
    return IO_WOULD_BLOCK;
  }
  if (st != sftp::SFTP_OK) {
    throw statusError(st, "fstat");
  }
  if (attrs.is_directory) {
    throw BackendError(BackendError::BE_IS_DIRECTORY,
                       "'" + path_ + "' is a directory");
  }
  out = ResourceDescriptor::fromStat(attrs.size, attrs.mtime);
  return IO_DONE;
}

void RemoteBackend::seekTo(off_t offset) {
  if (position_ == offset) {
    return;
  }
  sftp::Status st = file_->seek(offset);
  if (st != sftp::SFTP_OK) {
    throw statusError(st, "seek");
  }
  position_ = offset;
}

IoResult RemoteBackend::readAt(off_t offset, std::size_t length,
                               std::string& out) {
  if (file_ == NULL) {
    throw BackendError(BackendError::BE_OTHER,
                       "read from unopened remote file '" + path_ + "'");
  }

  if (pending_offset_ != offset || pending_length_ != length) {
    // a new request; anything gathered for another one is stale
    pending_.clear();
    pending_offset_ = offset;
    pending_length_ = length;
    seekTo(offset);
  }

  while (pending_.size() < length) {
    std::size_t have = pending_.size();
    std::size_t nread = 0;
    pending_.resize(length);
    sftp::Status st = file_->read(&pending_[have], length - have, nread);
    pending_.resize(have + (st == sftp::SFTP_OK ? nread : 0));
    if (st == sftp::SFTP_AGAIN) {
      return IO_WOULD_BLOCK;
    }
    if (st != sftp::SFTP_OK) {
      pending_offset_ = -1;
      position_ = -1;
      throw statusError(st, "read");
    }
    position_ += static_cast<off_t>(nread);
    if (nread == 0) {
      break;  // EOF
    }
  }

  out.swap(pending_);
  pending_.clear();
  pending_offset_ = -1;
  pending_length_ = 0;
  return IO_DONE;
}

void RemoteBackend::close() {
  sftp::Status file_status = sftp::SFTP_OK;
  if (file_ != NULL) {
    LOG(DEBUG) << "storage: closing remote '" << path_ << "'";
    file_status = file_->close();
    delete file_;
    file_ = NULL;
  }

  sftp::Status session_status = sftp::SFTP_OK;
  if (ownership_ == OWN_SESSION) {
    LOG(DEBUG) << "storage: disconnecting owned session for '" << path_ << "'";
    session_status = session_.disconnect();
  }

  if (file_status != sftp::SFTP_OK) {
    throw statusError(file_status, "close");
  }
  if (session_status != sftp::SFTP_OK) {
    throw statusError(session_status, "disconnect");
  }
}

int RemoteBackend::getMonitorFd() const {
  return session_.socketFd();
}

std::string RemoteBackend::path() const {
  return path_;
}

SessionOwnership RemoteBackend::ownership() const {
  return ownership_;
}
