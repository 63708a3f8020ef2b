#pragma once

#include <stdexcept>
#include <string>

// Failure of a storage backend operation (stat, read or close).
class BackendError : public std::runtime_error {
 public:
  enum Kind {
    BE_NOT_FOUND,
    BE_PERMISSION_DENIED,
    BE_CONNECTION_LOST,
    BE_IS_DIRECTORY,
    BE_OTHER
  };

  BackendError(Kind kind, const std::string& detail);

  Kind kind() const;

  static Kind kindFromErrno(int err);
  static const char* kindName(Kind kind);

 private:
  Kind kind_;
};
