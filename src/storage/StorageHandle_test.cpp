#include "StorageHandle.hpp"

#include <gtest/gtest.h>

#include "test_helpers.hpp"

namespace {

// Backend whose close() fails
class FailingCloseBackend : public MemoryBackend {
 public:
  explicit FailingCloseBackend(BackendCounters* counters)
      : MemoryBackend("data", counters) {}

  virtual void close() {
    MemoryBackend::close();
    throw BackendError(BackendError::BE_CONNECTION_LOST, "close failed");
  }
};

}  // namespace

TEST(StorageHandleTests, DestructorClosesOnce) {
  BackendCounters counters;
  {
    StorageHandle handle(new MemoryBackend("abc", &counters));
    EXPECT_TRUE(handle.isOpen());
    EXPECT_EQ(handle->path(), "/data/sample.bin");
  }
  EXPECT_EQ(counters.closes, 1);
  EXPECT_TRUE(counters.deleted);
}

TEST(StorageHandleTests, ReleaseIsIdempotent) {
  BackendCounters counters;
  StorageHandle handle(new MemoryBackend("abc", &counters));
  handle.release();
  EXPECT_FALSE(handle.isOpen());
  EXPECT_TRUE(handle.get() == NULL);
  handle.release();
  handle.release();
  EXPECT_EQ(counters.closes, 1);
}

TEST(StorageHandleTests, DetachTransfersOwnership) {
  BackendCounters counters;
  IStorageBackend* backend = NULL;
  {
    StorageHandle handle(new MemoryBackend("abc", &counters));
    backend = handle.detach();
    EXPECT_FALSE(handle.isOpen());
  }
  EXPECT_EQ(counters.closes, 0);
  EXPECT_FALSE(counters.deleted);

  StorageHandle other(backend);
  other.release();
  EXPECT_EQ(counters.closes, 1);
  EXPECT_TRUE(counters.deleted);
}

TEST(StorageHandleTests, CloseFailureIsLoggedNotThrown) {
  BackendCounters counters;
  StorageHandle handle(new FailingCloseBackend(&counters));
  EXPECT_NO_THROW(handle.release());
  EXPECT_EQ(counters.closes, 1);
  EXPECT_TRUE(counters.deleted);
  EXPECT_NO_THROW(handle.release());
  EXPECT_EQ(counters.closes, 1);
}

TEST(StorageHandleTests, EmptyHandle) {
  StorageHandle handle(NULL);
  EXPECT_FALSE(handle.isOpen());
  EXPECT_NO_THROW(handle.release());
}
