#pragma once

#include <string>

#include "IStorageBackend.hpp"

// Backend over a local file. Uses blocking pread(); regular files never
// report IO_WOULD_BLOCK.
class LocalBackend : public IStorageBackend {
 public:
  explicit LocalBackend(const std::string& path);
  virtual ~LocalBackend();

  virtual IoResult stat(ResourceDescriptor& out);
  virtual IoResult readAt(off_t offset, std::size_t length, std::string& out);
  virtual void close();
  virtual std::string path() const;

 private:
  LocalBackend(const LocalBackend&);
  LocalBackend& operator=(const LocalBackend&);

  std::string path_;
  int fd_;
};
