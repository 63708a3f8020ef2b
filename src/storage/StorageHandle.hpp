#pragma once

#include "IStorageBackend.hpp"

// Owns one backend and closes it exactly once: on release(), or when the
// handle is destroyed, whichever happens first. The backend object is
// deleted together with the close.
class StorageHandle {
 public:
  explicit StorageHandle(IStorageBackend* backend);
  ~StorageHandle();

  IStorageBackend* get() const;
  IStorageBackend* operator->() const;
  bool isOpen() const;

  // Close and delete the backend. Later calls do nothing.
  void release();

  // Give up ownership without closing; the handle becomes empty.
  IStorageBackend* detach();

 private:
  StorageHandle(const StorageHandle&);
  StorageHandle& operator=(const StorageHandle&);

  IStorageBackend* backend_;
};
