#include "RemoteBackend.hpp"

#include <gtest/gtest.h>

#include <string>

#include "BackendError.hpp"
#include "file_utils.hpp"
#include "test_helpers.hpp"

TEST(RemoteBackendTests, StatOpensAndDescribes) {
  FakeRemote remote;
  remote.content = "hello remote";
  FakeSession session(remote);
  RemoteBackend backend(session, "/pub/hello.txt", BORROW_SESSION);

  ResourceDescriptor d;
  ASSERT_EQ(backend.stat(d), IO_DONE);
  EXPECT_EQ(d.size, 12);
  EXPECT_EQ(d.last_modified, remote.mtime);
  EXPECT_EQ(d.etag, file_utils::makeETag(remote.mtime, 12));
  EXPECT_EQ(remote.opens, 1);

  // a second stat reuses the open file
  ASSERT_EQ(backend.stat(d), IO_DONE);
  EXPECT_EQ(remote.opens, 1);
  backend.close();
}

TEST(RemoteBackendTests, WouldBlockIsRetried) {
  FakeRemote remote;
  remote.content = "0123456789";
  remote.block_every_other_call = true;
  remote.fd = 7;
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", BORROW_SESSION);
  EXPECT_EQ(backend.getMonitorFd(), 7);

  ResourceDescriptor d;
  int attempts = 0;
  IoResult r;
  while ((r = backend.stat(d)) == IO_WOULD_BLOCK) {
    ASSERT_LT(++attempts, 10);
  }
  EXPECT_EQ(d.size, 10);
  EXPECT_EQ(remote.opens, 1);

  std::string out;
  attempts = 0;
  while ((r = backend.readAt(2, 5, out)) == IO_WOULD_BLOCK) {
    ASSERT_LT(++attempts, 10);
  }
  EXPECT_EQ(out, "23456");
  backend.close();
}

TEST(RemoteBackendTests, ShortServerReadsAreGathered) {
  FakeRemote remote;
  remote.content = patternData(1000);
  remote.max_read = 7;
  remote.block_every_other_call = true;
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", BORROW_SESSION);

  ResourceDescriptor d;
  while (backend.stat(d) == IO_WOULD_BLOCK) {
  }
  std::string out;
  while (backend.readAt(100, 300, out) == IO_WOULD_BLOCK) {
  }
  EXPECT_EQ(out, remote.content.substr(100, 300));

  // a non-sequential read seeks
  while (backend.readAt(10, 20, out) == IO_WOULD_BLOCK) {
  }
  EXPECT_EQ(out, remote.content.substr(10, 20));
  backend.close();
}

TEST(RemoteBackendTests, ReadStopsAtEof) {
  FakeRemote remote;
  remote.content = "abc";
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", BORROW_SESSION);
  ResourceDescriptor d;
  ASSERT_EQ(backend.stat(d), IO_DONE);
  std::string out;
  ASSERT_EQ(backend.readAt(1, 10, out), IO_DONE);
  EXPECT_EQ(out, "bc");
  backend.close();
}

TEST(RemoteBackendTests, MissingFileIsNotFound) {
  FakeRemote remote;
  remote.exists = false;
  FakeSession session(remote);
  RemoteBackend backend(session, "/nope", BORROW_SESSION);
  ResourceDescriptor d;
  try {
    backend.stat(d);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.kind(), BackendError::BE_NOT_FOUND);
  }
  backend.close();
  // nothing was opened, so nothing to close on the server
  EXPECT_EQ(remote.file_closes, 0);
  EXPECT_EQ(remote.disconnects, 0);
}

TEST(RemoteBackendTests, DirectoryIsRejected) {
  FakeRemote remote;
  remote.is_directory = true;
  FakeSession session(remote);
  RemoteBackend backend(session, "/pub", BORROW_SESSION);
  ResourceDescriptor d;
  try {
    backend.stat(d);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.kind(), BackendError::BE_IS_DIRECTORY);
  }
  backend.close();
  EXPECT_EQ(remote.file_closes, 1);
}

TEST(RemoteBackendTests, LostConnectionDuringRead) {
  FakeRemote remote;
  remote.content = patternData(100);
  remote.fail_read_on_call = 1;
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", BORROW_SESSION);
  ResourceDescriptor d;
  ASSERT_EQ(backend.stat(d), IO_DONE);
  std::string out;
  try {
    backend.readAt(0, 10, out);
    FAIL() << "expected BackendError";
  } catch (const BackendError& e) {
    EXPECT_EQ(e.kind(), BackendError::BE_CONNECTION_LOST);
  }
  backend.close();
}

TEST(RemoteBackendTests, BorrowedSessionStaysConnected) {
  FakeRemote remote;
  remote.content = "x";
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", BORROW_SESSION);
  ResourceDescriptor d;
  ASSERT_EQ(backend.stat(d), IO_DONE);
  backend.close();
  EXPECT_EQ(backend.ownership(), BORROW_SESSION);
  EXPECT_EQ(remote.file_closes, 1);
  EXPECT_EQ(remote.disconnects, 0);
}

TEST(RemoteBackendTests, OwnedSessionIsDisconnected) {
  FakeRemote remote;
  remote.content = "x";
  FakeSession session(remote);
  RemoteBackend backend(session, "/f", OWN_SESSION);
  ResourceDescriptor d;
  ASSERT_EQ(backend.stat(d), IO_DONE);
  backend.close();
  EXPECT_EQ(remote.file_closes, 1);
  EXPECT_EQ(remote.disconnects, 1);
}
