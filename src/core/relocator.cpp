#include "core/relocator.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

fs::path Relocator::uniqueTarget(const fs::path &directory, const std::string &filename, const fs::path &source)
{
    fs::path name(filename);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();
    std::error_code ec;
    fs::path candidate = directory / filename;
    for (int counter = 1;; ++counter)
    {
        if (!fs::exists(candidate, ec))
            return candidate;
        // The source itself already holds this name
        if (!source.empty() && fs::equivalent(candidate, source, ec))
            return candidate;
        candidate = directory / (stem + "_" + std::to_string(counter) + ext);
    }
}

bool Relocator::moveFile(const fs::path &source, const fs::path &target, std::string &error_message)
{
    std::error_code ec;
    fs::rename(source, target, ec);
    if (!ec)
        return true;

    if (ec != std::errc::cross_device_link)
    {
        error_message = "rename failed: " + ec.message();
        return false;
    }

    Logger::debug("Cross-device move, copying " + source.string() + " -> " + target.string());
    auto mtime = fs::last_write_time(source, ec);
    if (ec)
    {
        error_message = "cannot read modification time: " + ec.message();
        return false;
    }

    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (ec)
    {
        error_message = "copy failed: " + ec.message();
        std::error_code cleanup_ec;
        fs::remove(target, cleanup_ec);
        return false;
    }

    fs::last_write_time(target, mtime, ec);
    if (ec)
    {
        Logger::warn("Could not preserve modification time on " + target.string() + ": " + ec.message());
    }

    fs::remove(source, ec);
    if (ec)
    {
        error_message = "copied but could not remove source: " + ec.message();
        std::error_code cleanup_ec;
        fs::remove(target, cleanup_ec);
        return false;
    }
    return true;
}

RelocationResult Relocator::moveInto(const std::string &source_path, const fs::path &directory,
                                     const std::string &filename)
{
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        return RelocationResult(ErrorKind::MOVE_FAILURE,
                                "Cannot create directory " + directory.string() + ": " + ec.message());
    }

    fs::path target = uniqueTarget(directory, filename, source_path);
    if (fs::equivalent(target, source_path, ec))
    {
        Logger::debug("Already in place: " + target.string());
        return RelocationResult(target.string());
    }

    std::string error_message;
    if (!moveFile(source_path, target, error_message))
    {
        return RelocationResult(ErrorKind::MOVE_FAILURE,
                                "Cannot move " + source_path + " to " + target.string() + ": " + error_message);
    }
    return RelocationResult(target.string());
}

RelocationResult Relocator::place(const std::string &source_path, const Destination &destination)
{
    return moveInto(source_path, destination.directory, destination.filename);
}

RelocationResult Relocator::quarantine(const std::string &source_path, const std::string &trash_root)
{
    return moveInto(source_path, trash_root, fs::path(source_path).filename().string());
}
