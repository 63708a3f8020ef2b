#pragma once

#include <sys/types.h>

#include <cstddef>
#include <string>

#include "ResourceDescriptor.hpp"

enum IoResult { IO_DONE = 0, IO_WOULD_BLOCK = 1 };

// Byte-addressable data source behind a range response.
//
// Operations either complete (IO_DONE) or make no progress and ask to be
// retried with the same arguments once getMonitorFd() is readable
// (IO_WOULD_BLOCK). Failures are thrown as BackendError.
class IStorageBackend {
 public:
  virtual ~IStorageBackend() {}

  // Open the resource if needed and describe it.
  virtual IoResult stat(ResourceDescriptor& out) = 0;

  // Replace `out` with up to `length` bytes starting at `offset`. Fewer
  // bytes are returned only when the resource ends first.
  virtual IoResult readAt(off_t offset, std::size_t length,
                          std::string& out) = 0;

  // Release the resource. Called once by StorageHandle.
  virtual void close() = 0;

  // File descriptor to wait on after IO_WOULD_BLOCK, -1 if never blocks.
  virtual int getMonitorFd() const {
    return -1;
  }

  // Path of the resource, for logs and default download names
  virtual std::string path() const = 0;
};
