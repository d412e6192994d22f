/**
 * @file test_file_enumerator.cpp
 * @brief Unit tests for local file enumeration
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::chunk_upload::test {

class FileEnumeratorTest : public TempDirectoryFixture {};

// ============================================================================
// Exclusion Rule Tests
// ============================================================================

TEST_F(FileEnumeratorTest, DefaultExclusions) {
    enumeration_options options;

    EXPECT_EQ(options.excluded_directories,
              (std::vector<std::string>{".git", "node_modules", ".idea", ".DS_Store", "cache",
                                        "tmp"}));
    EXPECT_EQ(options.max_files, 50000u);
}

TEST_F(FileEnumeratorTest, IsExcludedMatchesDirectoryComponents) {
    file_enumerator enumerator;

    EXPECT_TRUE(enumerator.is_excluded(".git/config"));
    EXPECT_TRUE(enumerator.is_excluded("assets/node_modules/lib/index.js"));
    EXPECT_TRUE(enumerator.is_excluded("a/b/tmp/c.txt"));
    EXPECT_FALSE(enumerator.is_excluded("docs/readme.md"));
    EXPECT_FALSE(enumerator.is_excluded("index.html"));
}

TEST_F(FileEnumeratorTest, FileNameIsNotCompared) {
    file_enumerator enumerator;

    EXPECT_FALSE(enumerator.is_excluded("tmp"));
    EXPECT_FALSE(enumerator.is_excluded("logs/cache"));
}

TEST_F(FileEnumeratorTest, SimilarNamesAreNotExcluded) {
    file_enumerator enumerator;

    EXPECT_FALSE(enumerator.is_excluded("cached/a.txt"));
    EXPECT_FALSE(enumerator.is_excluded("my.git/a.txt"));
}

// ============================================================================
// Enumeration Tests
// ============================================================================

TEST_F(FileEnumeratorTest, ListsRelativeSortedPaths) {
    create_text_file("index.html", "<html/>");
    create_text_file("css/site.css", "body{}");
    create_text_file("assets/img/logo.png", "png");

    auto files = file_enumerator().enumerate(source_dir_);

    ASSERT_TRUE(files.has_value()) << files.error().message;
    EXPECT_EQ(files.value(), (std::vector<std::string>{"assets/img/logo.png", "css/site.css",
                                                       "index.html"}));
}

TEST_F(FileEnumeratorTest, SkipsExcludedDirectories) {
    create_text_file("index.html", "x");
    create_text_file(".git/HEAD", "ref: refs/heads/main");
    create_text_file("node_modules/pkg/index.js", "js");
    create_text_file("src/cache/entry.bin", "c");
    create_text_file("src/main.js", "m");

    auto files = file_enumerator().enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value(), (std::vector<std::string>{"index.html", "src/main.js"}));
}

TEST_F(FileEnumeratorTest, CustomExclusions) {
    create_text_file("build/out.o", "o");
    create_text_file("tmp/keep.txt", "k");

    enumeration_options options;
    options.excluded_directories = {"build"};
    auto files = file_enumerator(options).enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value(), (std::vector<std::string>{"tmp/keep.txt"}));
}

TEST_F(FileEnumeratorTest, DirectoriesAreNotListed) {
    std::filesystem::create_directories(source_dir_ / "empty" / "nested");
    create_text_file("a.txt", "a");

    auto files = file_enumerator().enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value(), (std::vector<std::string>{"a.txt"}));
}

TEST_F(FileEnumeratorTest, EmptyDirectoryGivesEmptyList) {
    auto files = file_enumerator().enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_TRUE(files.value().empty());
}

TEST_F(FileEnumeratorTest, MaxFilesLimitsResult) {
    for (int i = 0; i < 5; ++i) {
        create_text_file("f" + std::to_string(i) + ".txt", "x");
    }

    enumeration_options options;
    options.max_files = 3;
    auto files = file_enumerator(options).enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value().size(), 3u);
}

TEST_F(FileEnumeratorTest, SymlinksAreSkipped) {
    auto target = create_text_file("real.txt", "r");
    std::error_code ec;
    std::filesystem::create_symlink(target, source_dir_ / "link.txt", ec);
    if (ec) {
        GTEST_SKIP() << "symlinks not supported: " << ec.message();
    }

    auto files = file_enumerator().enumerate(source_dir_);

    ASSERT_TRUE(files.has_value());
    EXPECT_EQ(files.value(), (std::vector<std::string>{"real.txt"}));
}

TEST_F(FileEnumeratorTest, MissingRootIsReported) {
    auto files = file_enumerator().enumerate(test_dir_ / "missing");

    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, error_code::local_file_not_found);
}

TEST_F(FileEnumeratorTest, FileRootIsReported) {
    auto path = create_text_file("a.txt", "a");

    auto files = file_enumerator().enumerate(path);

    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, error_code::local_file_not_found);
}

}  // namespace kcenon::chunk_upload::test
