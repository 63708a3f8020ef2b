#include "StorageHandle.hpp"

#include "BackendError.hpp"
#include "Logger.hpp"

StorageHandle::StorageHandle(IStorageBackend* backend) : backend_(backend) {}

StorageHandle::~StorageHandle() {
  release();
}

IStorageBackend* StorageHandle::get() const {
  return backend_;
}

IStorageBackend* StorageHandle::operator->() const {
  return backend_;
}

bool StorageHandle::isOpen() const {
  return backend_ != NULL;
}

void StorageHandle::release() {
  if (backend_ == NULL) {
    return;
  }
  IStorageBackend* backend = backend_;
  backend_ = NULL;
  LOG(DEBUG) << "storage: releasing '" << backend->path() << "'";
  try {
    backend->close();
  } catch (const BackendError& e) {
    LOG(ERROR) << "storage: close failed for '" << backend->path()
               << "' (" << BackendError::kindName(e.kind())
               << "): " << e.what();
  }
  delete backend;
}

IStorageBackend* StorageHandle::detach() {
  IStorageBackend* backend = backend_;
  backend_ = NULL;
  return backend;
}
