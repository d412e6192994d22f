/**
 * @file test_remote_path.cpp
 * @brief Unit tests for remote final/partial naming
 */

#include <gtest/gtest.h>

#include <kcenon/chunk_upload/core/remote_path.h>

#include <string>
#include <vector>

namespace kcenon::chunk_upload::test {

class RemotePathTest : public ::testing::Test {};

TEST_F(RemotePathTest, NormalizeSeparators) {
    EXPECT_EQ(normalize_remote_path("a\\b\\c.txt"), "a/b/c.txt");
    EXPECT_EQ(normalize_remote_path("/srv//www///site"), "/srv/www/site");
    EXPECT_EQ(normalize_remote_path("/srv/www/"), "/srv/www");
    EXPECT_EQ(normalize_remote_path("/"), "/");
    EXPECT_EQ(normalize_remote_path(""), "");
}

TEST_F(RemotePathTest, TargetUnderRemoteDirectory) {
    auto target = make_remote_target("/var/www/html", "assets/app.js");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "/var/www/html/assets/app.js");
    EXPECT_EQ(target.value().partial_path, "/var/www/html/assets/app.js.part");
    EXPECT_EQ(target.value().directory, "/var/www/html/assets");
}

TEST_F(RemotePathTest, PartialNameIsFinalPlusSuffix) {
    auto target = make_remote_target("/upload", "x.bin");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().partial_path, target.value().final_path + ".part");
}

TEST_F(RemotePathTest, TrailingSlashOnRemoteDirectory) {
    auto target = make_remote_target("/upload/", "x.bin");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "/upload/x.bin");
}

TEST_F(RemotePathTest, RootRemoteDirectory) {
    auto target = make_remote_target("/", "x.bin");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "/x.bin");
    EXPECT_EQ(target.value().directory, "/");
}

TEST_F(RemotePathTest, EmptyRemoteDirectoryMeansLoginDirectory) {
    auto target = make_remote_target("", "docs/readme.md");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "docs/readme.md");
    EXPECT_EQ(target.value().directory, "docs");
}

TEST_F(RemotePathTest, FileInLoginDirectoryHasNoDirectory) {
    auto target = make_remote_target("", "readme.md");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "readme.md");
    EXPECT_TRUE(target.value().directory.empty());
}

TEST_F(RemotePathTest, WindowsSeparatorsInRelativePath) {
    auto target = make_remote_target("/upload", "sub\\dir\\file.txt");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "/upload/sub/dir/file.txt");
}

TEST_F(RemotePathTest, LeadingSlashOnRelativePathIsDropped) {
    auto target = make_remote_target("/upload", "/file.txt");

    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target.value().final_path, "/upload/file.txt");
}

TEST_F(RemotePathTest, EmptyRelativePathIsRejected) {
    auto target = make_remote_target("/upload", "");

    ASSERT_FALSE(target.has_value());
    EXPECT_EQ(target.error().code, error_code::invalid_remote_path);
}

TEST_F(RemotePathTest, ParentTraversalIsRejected) {
    auto escaping = make_remote_target("/upload", "../etc/passwd");
    auto nested = make_remote_target("/upload", "a/../../b");

    ASSERT_FALSE(escaping.has_value());
    EXPECT_EQ(escaping.error().code, error_code::invalid_remote_path);
    ASSERT_FALSE(nested.has_value());
}

TEST_F(RemotePathTest, DotsInsideNamesAreAllowed) {
    auto target = make_remote_target("/upload", "release..notes.txt");

    EXPECT_TRUE(target.has_value());
}

TEST_F(RemotePathTest, ParentDirectory) {
    EXPECT_EQ(parent_directory("/a/b/c"), "/a/b");
    EXPECT_EQ(parent_directory("/a"), "/");
    EXPECT_EQ(parent_directory("a/b"), "a");
    EXPECT_EQ(parent_directory("a"), "");
}

TEST_F(RemotePathTest, DirectoryPrefixesAbsolute) {
    std::vector<std::string> expected{"/srv", "/srv/a", "/srv/a/b"};

    EXPECT_EQ(directory_prefixes("/srv/a/b"), expected);
}

TEST_F(RemotePathTest, DirectoryPrefixesRelative) {
    std::vector<std::string> expected{"a", "a/b"};

    EXPECT_EQ(directory_prefixes("a/b"), expected);
}

TEST_F(RemotePathTest, DirectoryPrefixesOfRoot) {
    EXPECT_TRUE(directory_prefixes("/").empty());
    EXPECT_TRUE(directory_prefixes("").empty());
}

}  // namespace kcenon::chunk_upload::test
