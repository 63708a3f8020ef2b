#include "Libssh2Session.hpp"

#include <gtest/gtest.h>

TEST(Libssh2StatusTests, SuccessAndWouldBlock) {
  EXPECT_EQ(sftp::statusFromLibssh2(0, 0), sftp::SFTP_OK);
  // libssh2_sftp_read returns a byte count
  EXPECT_EQ(sftp::statusFromLibssh2(4096, 0), sftp::SFTP_OK);
  EXPECT_EQ(sftp::statusFromLibssh2(LIBSSH2_ERROR_EAGAIN, 0),
            sftp::SFTP_AGAIN);
}

TEST(Libssh2StatusTests, TransportErrorsAreConnectionLost) {
  int codes[] = {LIBSSH2_ERROR_SOCKET_SEND, LIBSSH2_ERROR_SOCKET_RECV,
                 LIBSSH2_ERROR_SOCKET_DISCONNECT, LIBSSH2_ERROR_SOCKET_TIMEOUT,
                 LIBSSH2_ERROR_TIMEOUT};
  for (std::size_t i = 0; i < sizeof(codes) / sizeof(codes[0]); ++i) {
    EXPECT_EQ(sftp::statusFromLibssh2(codes[i], 0),
              sftp::SFTP_CONNECTION_LOST)
        << codes[i];
  }
}

TEST(Libssh2StatusTests, SftpProtocolErrorsUseServerStatus) {
  int rc = LIBSSH2_ERROR_SFTP_PROTOCOL;
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_NO_SUCH_FILE),
            sftp::SFTP_NO_SUCH_FILE);
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_NO_SUCH_PATH),
            sftp::SFTP_NO_SUCH_FILE);
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_PERMISSION_DENIED),
            sftp::SFTP_PERMISSION_DENIED);
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_CONNECTION_LOST),
            sftp::SFTP_CONNECTION_LOST);
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_NO_CONNECTION),
            sftp::SFTP_CONNECTION_LOST);
  EXPECT_EQ(sftp::statusFromLibssh2(rc, LIBSSH2_FX_FAILURE),
            sftp::SFTP_FAILURE);
}

TEST(Libssh2StatusTests, ServerStatusIgnoredForOtherErrors) {
  EXPECT_EQ(sftp::statusFromLibssh2(LIBSSH2_ERROR_ALLOC,
                                    LIBSSH2_FX_NO_SUCH_FILE),
            sftp::SFTP_FAILURE);
}
