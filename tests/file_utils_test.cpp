#include <gtest/gtest.h>
#include "core/file_utils.hpp"
#include "test_base.hpp"
#include <algorithm>
#include <filesystem>
#include <vector>
#include <string>
#include <fstream>

namespace fs = std::filesystem;

class FileUtilsTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        // Create test directory structure
        createFile("test_dir/b_photo.JPG");
        createFile("test_dir/a_clip.mov");
        createFile("test_dir/subdir1/notes.txt");
        createFile("test_dir/subdir2/deep/photo.heic");
    }
};

TEST_F(FileUtilsTest, ListFilesNonRecursive)
{
    std::vector<std::string> files;
    bool completed = false;
    bool error_occurred = false;

    auto observable = FileUtils::listFilesAsObservable(path("test_dir"), false);
    observable.subscribe(
        [&files](const std::string &file_path)
        {
            files.push_back(file_path);
        },
        [&error_occurred](const std::exception &e)
        {
            error_occurred = true;
            FAIL() << "Unexpected error in file listing: " << e.what();
        },
        [&completed]()
        {
            completed = true;
        });

    // Only the two files directly in the root
    EXPECT_EQ(files.size(), 2u);
    EXPECT_TRUE(completed);
    EXPECT_FALSE(error_occurred);
}

TEST_F(FileUtilsTest, CollectFilesIsRecursiveAndSorted)
{
    std::string error;
    auto files = FileUtils::collectFiles(path("test_dir"), &error);

    EXPECT_TRUE(error.empty());
    ASSERT_EQ(files.size(), 4u);
    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
    EXPECT_EQ(fs::path(files[0]).filename(), "a_clip.mov");
    EXPECT_EQ(fs::path(files[3]).filename(), "photo.heic");
}

TEST_F(FileUtilsTest, InvalidDirectory)
{
    bool error_received = false;
    std::string error_message;

    auto observable = FileUtils::listFilesAsObservable(path("nonexistent_dir"), false);
    observable.subscribe(
        [](const std::string &)
        {
            FAIL() << "Should not receive any files for invalid directory";
        },
        [&error_received, &error_message](const std::exception &e)
        {
            error_received = true;
            error_message = e.what();
        },
        []()
        {
            FAIL() << "Should not complete successfully for invalid directory";
        });

    EXPECT_TRUE(error_received);
    EXPECT_TRUE(error_message.find("Invalid directory path") != std::string::npos);

    std::string collect_error;
    EXPECT_TRUE(FileUtils::collectFiles(path("nonexistent_dir"), &collect_error).empty());
    EXPECT_FALSE(collect_error.empty());
}

TEST_F(FileUtilsTest, ClassifiesByCaseInsensitiveExtension)
{
    EXPECT_EQ(FileUtils::getFileExtension("/x/IMG_0001.JPG"), "jpg");
    EXPECT_EQ(FileUtils::getFileExtension("/x/noext"), "");
    EXPECT_EQ(FileUtils::getMediaKind("/x/IMG_0001.JPG"), MediaKind::IMAGE);
    EXPECT_EQ(FileUtils::getMediaKind("/x/scan.tif"), MediaKind::IMAGE);
    EXPECT_EQ(FileUtils::getMediaKind("/x/clip.MkV"), MediaKind::VIDEO);
    EXPECT_EQ(FileUtils::getMediaKind("/x/readme.txt"), MediaKind::UNSUPPORTED);
    EXPECT_TRUE(FileUtils::isImageFile("a.heic"));
    EXPECT_TRUE(FileUtils::isVideoFile("a.wmv"));
    EXPECT_FALSE(FileUtils::isVideoFile("a.jpg"));
}

TEST_F(FileUtilsTest, GetMediaFileSnapshotsStat)
{
    std::string file = createFile("snap/IMG_0001.JPG", "12345");
    auto media = FileUtils::getMediaFile(file);

    ASSERT_TRUE(media.has_value());
    EXPECT_TRUE(fs::path(media->path).is_absolute());
    EXPECT_EQ(media->extension, ".JPG");
    EXPECT_EQ(media->kind, MediaKind::IMAGE);
    EXPECT_EQ(media->size_bytes, 5u);
    EXPECT_GT(media->modification_time, 0);

    EXPECT_FALSE(FileUtils::getMediaFile(path("snap/missing.jpg")).has_value());
    EXPECT_FALSE(FileUtils::getMediaFile(path("snap")).has_value());
}

TEST_F(FileUtilsTest, EnsureDirectoryCreatesParents)
{
    std::string target = path("a/b/c");
    std::string error;
    EXPECT_TRUE(FileUtils::ensureDirectory(target, &error));
    EXPECT_TRUE(FileUtils::isValidDirectory(target));

    std::string file = createFile("plain.txt");
    EXPECT_FALSE(FileUtils::ensureDirectory(file, &error));
    EXPECT_FALSE(error.empty());
}

TEST_F(FileUtilsTest, ClassificationFollowsConfiguredExtensions)
{
    MediaExtensions extensions;
    extensions.images = {"webp"};
    extensions.videos = {"mp4"};
    createFile("custom/a.webp");
    createFile("custom/b.jpg");

    EXPECT_EQ(extensions.classify("webp"), MediaKind::IMAGE);
    EXPECT_EQ(extensions.classify("mp4"), MediaKind::VIDEO);
    EXPECT_EQ(extensions.classify("jpg"), MediaKind::UNSUPPORTED);
    EXPECT_EQ(extensions.classify(""), MediaKind::UNSUPPORTED);

    auto webp = FileUtils::getMediaFile(path("custom/a.webp"), extensions);
    ASSERT_TRUE(webp.has_value());
    EXPECT_EQ(webp->kind, MediaKind::IMAGE);
    EXPECT_FALSE(FileUtils::getMediaFile(path("custom/b.jpg"), extensions).has_value());
    EXPECT_TRUE(FileUtils::getMediaFile(path("custom/b.jpg")).has_value());
}
