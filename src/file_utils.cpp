#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <sys/stat.h>

namespace fs = std::filesystem;

const std::vector<std::string> FileUtils::image_extensions_ = {"jpg", "jpeg", "png", "tiff", "tif", "bmp", "heic"};
const std::vector<std::string> FileUtils::video_extensions_ = {"mp4", "mov", "avi", "mkv", "wmv"};

PathStream FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    return PathStream([dir_path, recursive](PathStream::FileHandler on_file, PathStream::ErrorHandler on_error,
                                            PathStream::CompleteHandler on_complete)
                      {
        if (!isValidDirectory(dir_path))
        {
            std::string msg = "Invalid directory path: " + dir_path;
            Logger::warn(msg);
            if (on_error)
                on_error(std::runtime_error(msg));
            return;
        }
        try
        {
            walkDirectory(fs::path(dir_path), recursive, on_file);
        }
        catch (const fs::filesystem_error &e)
        {
            std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
            Logger::warn(msg);
            if (on_error)
                on_error(std::runtime_error(msg));
            return;
        }
        if (on_complete)
            on_complete(); });
}

void FileUtils::walkDirectory(const fs::path &dir, bool recursive, const PathStream::FileHandler &on_file)
{
    std::vector<fs::directory_entry> entries;
    for (const auto &entry : fs::directory_iterator(dir))
        entries.push_back(entry);
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b)
              { return a.path() < b.path(); });

    for (const auto &entry : entries)
    {
        std::error_code ec;
        if (entry.is_symlink(ec))
        {
            Logger::debug("Skipping symbolic link: " + entry.path().string());
            continue;
        }
        if (entry.is_regular_file(ec))
        {
            on_file(entry.path().string());
        }
        else if (recursive && entry.is_directory(ec))
        {
            try
            {
                walkDirectory(entry.path(), recursive, on_file);
            }
            catch (const fs::filesystem_error &e)
            {
                // Siblings are still visited
                Logger::warn("Skipping unreadable directory " + entry.path().string() + ": " + e.what());
            }
        }
        else if (ec)
        {
            Logger::warn("Skipping entry " + entry.path().string() + ": " + ec.message());
        }
    }
}

std::vector<std::string> FileUtils::collectFiles(const std::string &dir_path, std::string *error_message)
{
    std::vector<std::string> files;
    auto observable = listFilesAsObservable(dir_path, true);
    observable.subscribe(
        [&files](const std::string &file_path)
        {
            files.push_back(file_path);
        },
        [error_message](const std::exception &e)
        {
            if (error_message)
            {
                *error_message = e.what();
            }
        },
        nullptr);
    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    fs::path dir_path(path);
    return fs::exists(dir_path, ec) && fs::is_directory(dir_path, ec);
}

bool FileUtils::ensureDirectory(const std::string &path, std::string *error_message)
{
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec)
    {
        if (error_message)
        {
            *error_message = "Cannot create directory " + path + ": " + ec.message();
        }
        return false;
    }
    if (!isValidDirectory(path))
    {
        if (error_message)
        {
            *error_message = "Not a directory: " + path;
        }
        return false;
    }
    return true;
}

MediaKind MediaExtensions::classify(const std::string &extension) const
{
    if (extension.empty())
        return MediaKind::UNSUPPORTED;
    if (std::find(images.begin(), images.end(), extension) != images.end())
        return MediaKind::IMAGE;
    if (std::find(videos.begin(), videos.end(), extension) != videos.end())
        return MediaKind::VIDEO;
    return MediaKind::UNSUPPORTED;
}

MediaExtensions MediaExtensions::defaults()
{
    MediaExtensions extensions;
    extensions.images = FileUtils::getImageExtensions();
    extensions.videos = FileUtils::getVideoExtensions();
    return extensions;
}

std::optional<MediaFile> FileUtils::getMediaFile(const std::string &file_path)
{
    return getMediaFile(file_path, MediaExtensions::defaults());
}

std::optional<MediaFile> FileUtils::getMediaFile(const std::string &file_path, const MediaExtensions &extensions)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    MediaFile media;
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(file_path), ec);
    media.path = ec ? file_path : absolute.lexically_normal().string();
    media.extension = fs::path(file_path).extension().string();
    media.kind = getMediaKind(file_path, extensions);
    media.size_bytes = static_cast<uint64_t>(st.st_size);
    media.modification_time = st.st_mtime;
    return media;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
    {
        ext = ext.substr(1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

MediaKind FileUtils::getMediaKind(const std::string &file_path, const MediaExtensions &extensions)
{
    return extensions.classify(getFileExtension(file_path));
}

MediaKind FileUtils::getMediaKind(const std::string &file_path)
{
    if (isImageFile(file_path))
        return MediaKind::IMAGE;
    if (isVideoFile(file_path))
        return MediaKind::VIDEO;
    return MediaKind::UNSUPPORTED;
}

bool FileUtils::isImageFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    return std::find(image_extensions_.begin(), image_extensions_.end(), ext) != image_extensions_.end();
}

bool FileUtils::isVideoFile(const std::string &file_path)
{
    std::string ext = getFileExtension(file_path);
    return std::find(video_extensions_.begin(), video_extensions_.end(), ext) != video_extensions_.end();
}

const std::vector<std::string> &FileUtils::getImageExtensions()
{
    return image_extensions_;
}

const std::vector<std::string> &FileUtils::getVideoExtensions()
{
    return video_extensions_;
}

std::string MediaFile::toString() const
{
    std::stringstream ss;
    ss << "MediaFile{"
       << "path='" << path << "', "
       << "kind=" << MediaKinds::getName(kind) << ", "
       << "size=" << size_bytes << ", "
       << "mod_time=" << modification_time << "}";
    return ss.str();
}
