#include <gtest/gtest.h>
#include <ssh/file_transfer.hpp>
#include <libssh2_sftp.h>

TEST(UploadFlags, NoOverwriteIsExclusive) {
    unsigned long f = upload_open_flags(false);
    EXPECT_TRUE(f & LIBSSH2_FXF_WRITE);
    EXPECT_TRUE(f & LIBSSH2_FXF_CREAT);
    EXPECT_TRUE(f & LIBSSH2_FXF_EXCL);
    EXPECT_FALSE(f & LIBSSH2_FXF_TRUNC);
}

TEST(UploadFlags, OverwriteTruncates) {
    unsigned long f = upload_open_flags(true);
    EXPECT_TRUE(f & LIBSSH2_FXF_CREAT);
    EXPECT_TRUE(f & LIBSSH2_FXF_TRUNC);
    EXPECT_FALSE(f & LIBSSH2_FXF_EXCL);
}

TEST(UploadFlags, CollisionStatuses) {
    EXPECT_TRUE(is_exclusive_collision(LIBSSH2_FX_FILE_ALREADY_EXISTS));
    // SFTP v3 servers have no dedicated status and answer FAILURE.
    EXPECT_TRUE(is_exclusive_collision(LIBSSH2_FX_FAILURE));
    EXPECT_FALSE(is_exclusive_collision(LIBSSH2_FX_NO_SUCH_FILE));
    EXPECT_FALSE(is_exclusive_collision(LIBSSH2_FX_PERMISSION_DENIED));
}
