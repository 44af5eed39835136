#include "dsync/sync/remote_paths.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace dsync::sync;
using dsync::ErrorKind;

TEST(RemotePathsTest, AcceptsAbsolutePaths) {
    EXPECT_TRUE(validate_remote_root("/srv/app").is_ok());
    EXPECT_TRUE(validate_remote_root("/").is_ok());
}

TEST(RemotePathsTest, RejectsEmptyRelativeAndControlCharacters) {
    for (const std::string& bad : {std::string(), std::string("srv/app"), std::string("~/app"),
                                   std::string("/srv/a\nb"), std::string("/srv/a\rb"),
                                   std::string("/srv/a\0b", 8)}) {
        auto result = validate_remote_root(bad);
        ASSERT_TRUE(result.is_error()) << bad;
        EXPECT_EQ(result.error().kind, ErrorKind::InvalidRemotePath);
    }
}

TEST(RemotePathsTest, DetectsFilesystemRoot) {
    EXPECT_TRUE(is_filesystem_root("/"));
    EXPECT_TRUE(is_filesystem_root("/."));
    EXPECT_TRUE(is_filesystem_root("/srv/.."));
    EXPECT_FALSE(is_filesystem_root("/srv"));
    EXPECT_FALSE(is_filesystem_root("/srv/app/"));
}

TEST(RemotePathsTest, JoinsWithSingleSeparator) {
    EXPECT_EQ(join_remote("/srv/app", "x"), "/srv/app/x");
    EXPECT_EQ(join_remote("/srv/app/", "x"), "/srv/app/x");
    EXPECT_EQ(join_remote("/", "x"), "/x");
}

TEST(RemotePathsTest, TemporaryArchiveLivesInRemoteRoot) {
    EXPECT_EQ(remote_temp_archive("/srv/app", "abc123", dsync::archive::ArchiveFormat::TarGz),
              "/srv/app/.dsync-abc123.tar.gz");
    EXPECT_EQ(remote_temp_archive("/srv/app", "abc123", dsync::archive::ArchiveFormat::Zip),
              "/srv/app/.dsync-abc123.zip");
}

TEST(RemotePathsTest, CommandsQuoteTheirOperands) {
    EXPECT_EQ(make_directory_command("/srv/my app"), "mkdir -p -- '/srv/my app'");
    EXPECT_EQ(remove_tree_command("/srv/it's"), "rm -rf -- '/srv/it'\\''s'");
    EXPECT_EQ(remove_file_command("/srv/app/.dsync-1.zip"), "rm -f -- '/srv/app/.dsync-1.zip'");
}
