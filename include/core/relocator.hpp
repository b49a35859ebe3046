#pragma once

#include "core/media_types.hpp"
#include "core/path_planner.hpp"
#include <filesystem>
#include <string>

struct RelocationResult
{
    bool success;
    ErrorKind error_kind;
    std::string error_message;
    std::string final_path;

    RelocationResult() : success(false), error_kind(ErrorKind::NONE) {}
    explicit RelocationResult(const std::string &path) : success(true), error_kind(ErrorKind::NONE), final_path(path) {}
    RelocationResult(ErrorKind kind, const std::string &msg) : success(false), error_kind(kind), error_message(msg) {}
};

/**
 * @brief Moves originals into the organized tree and duplicates into the trash
 *
 * Never overwrites: an occupied target name gets a _1, _2, ... suffix on its
 * stem. Intermediate directories are created on demand. A rename across
 * filesystems degrades to copy (keeping the modification time) plus delete;
 * on failure the source stays in place and partial copies are removed.
 */
class Relocator
{
public:
    static RelocationResult place(const std::string &source_path, const Destination &destination);

    // Moves a duplicate to <trash_root>/<base filename>
    static RelocationResult quarantine(const std::string &source_path, const std::string &trash_root);

    /**
     * @brief First free path for a filename inside a directory
     * @param source When given, a candidate that already is this file counts as free
     * @return dir/name.ext, else dir/name_1.ext, dir/name_2.ext, ...
     */
    static std::filesystem::path uniqueTarget(const std::filesystem::path &directory, const std::string &filename,
                                              const std::filesystem::path &source = std::filesystem::path());

private:
    static RelocationResult moveInto(const std::string &source_path, const std::filesystem::path &directory,
                                     const std::string &filename);
    static bool moveFile(const std::filesystem::path &source, const std::filesystem::path &target,
                         std::string &error_message);
};
