#pragma once

#include "core/media_types.hpp"
#include <filesystem>
#include <string>
#include <exception>
#include <functional>
#include <vector>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

/**
 * @brief Push-style stream of file paths produced by a directory walk
 *
 * Nothing is read until subscribe() is called; the walk runs on the caller's
 * thread and every handler is optional except on_file.
 */
class PathStream
{
public:
    using FileHandler = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    using Producer = std::function<void(FileHandler, ErrorHandler, CompleteHandler)>;

    explicit PathStream(Producer producer) : producer_(std::move(producer)) {}

    // Exactly one of on_error or on_complete is invoked at the end
    void subscribe(FileHandler on_file, ErrorHandler on_error = nullptr, CompleteHandler on_complete = nullptr) const
    {
        if (producer_)
            producer_(on_file, on_error, on_complete);
    }

private:
    Producer producer_;
};

/**
 * @brief Extension lists (lowercase, no dot) that decide a file's MediaKind
 *
 * Images win when an extension appears in both lists.
 */
struct MediaExtensions
{
    std::vector<std::string> images;
    std::vector<std::string> videos;

    MediaKind classify(const std::string &extension) const;

    // The built-in image and video lists
    static MediaExtensions defaults();
};

/**
 * @brief File utilities for enumeration and classification of media files
 */
class FileUtils
{
public:
    /**
     * @brief Stream the regular files under a directory
     * @param dir_path Directory to walk
     * @param recursive Descend into subdirectories (symlinks are never followed)
     * @return PathStream emitting paths in lexical order per directory
     */
    static PathStream listFilesAsObservable(const std::string &dir_path, bool recursive = false);

    /**
     * Collects every regular file under a directory, sorted by path
     * @param dir_path Directory path to scan
     * @param error_message Set when the directory cannot be listed
     * @return Sorted file paths
     */
    static std::vector<std::string> collectFiles(const std::string &dir_path, std::string *error_message = nullptr);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Ensure a directory exists, creating parents as needed
     * @return true if the directory exists afterwards
     */
    static bool ensureDirectory(const std::string &path, std::string *error_message = nullptr);

    /**
     * @brief Stat a file into a MediaFile record (no content is read)
     * @param file_path Path to the file
     * @return MediaFile if the file exists and is a regular file
     */
    static std::optional<MediaFile> getMediaFile(const std::string &file_path);
    static std::optional<MediaFile> getMediaFile(const std::string &file_path, const MediaExtensions &extensions);

    /**
     * @brief Lower-case extension without the leading dot ("IMG.JPG" -> "jpg")
     */
    static std::string getFileExtension(const std::string &file_path);

    static MediaKind getMediaKind(const std::string &file_path);
    static MediaKind getMediaKind(const std::string &file_path, const MediaExtensions &extensions);
    static bool isImageFile(const std::string &file_path);
    static bool isVideoFile(const std::string &file_path);

    static const std::vector<std::string> &getImageExtensions();
    static const std::vector<std::string> &getVideoExtensions();

private:
    static const std::vector<std::string> image_extensions_;
    static const std::vector<std::string> video_extensions_;

    // Depth-first walk of one directory; unreadable entries are logged and skipped
    static void walkDirectory(const fs::path &dir, bool recursive, const PathStream::FileHandler &on_file);
};
