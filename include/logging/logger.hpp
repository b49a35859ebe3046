#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>

/**
 * @brief Process-wide logger shared by every component
 *
 * One named spdlog logger with a colored stdout sink; a file sink can be
 * attached once configuration is known.
 */
class Logger
{
public:
    /**
     * @brief Set the threshold from a level name
     * @param log_level TRACE, DEBUG, INFO, WARN or ERROR in any case; anything
     *        else selects INFO and logs a warning
     */
    static void init(const std::string &log_level = "INFO")
    {
        auto logger = getLogger();
        std::string name = normalizeLevel(log_level);
        bool known = name == "TRACE" || name == "DEBUG" || name == "INFO" || name == "WARN" || name == "ERROR";
        logger->set_level(known ? toSpdlogLevel(name) : spdlog::level::info);
        if (!known)
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
    }

    /**
     * @brief Mirror all log output into an append-mode file
     * @param file_path Log file path; parent directories are created
     * @return true if the sink was attached
     */
    static bool addFileSink(const std::string &file_path)
    {
        try
        {
            std::filesystem::path path(file_path);
            if (path.has_parent_path())
            {
                std::filesystem::create_directories(path.parent_path());
            }
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            sink->set_pattern(kPattern);
            getLogger()->sinks().push_back(sink);
            return true;
        }
        catch (const std::exception &e)
        {
            warn("Could not open log file " + file_path + ": " + e.what());
            return false;
        }
    }

    static void trace(const std::string &message) { getLogger()->log(spdlog::level::trace, message); }
    static void debug(const std::string &message) { getLogger()->log(spdlog::level::debug, message); }
    static void info(const std::string &message) { getLogger()->log(spdlog::level::info, message); }
    static void warn(const std::string &message) { getLogger()->log(spdlog::level::warn, message); }
    static void error(const std::string &message) { getLogger()->log(spdlog::level::err, message); }

private:
    static constexpr const char *kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = []()
        {
            auto created = spdlog::stdout_color_mt("media_organizer");
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            return created;
        }();
        return logger;
    }

    static std::string normalizeLevel(std::string level)
    {
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        if (level == "WARNING")
            return "WARN";
        return level;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &name)
    {
        if (name == "TRACE")
            return spdlog::level::trace;
        if (name == "DEBUG")
            return spdlog::level::debug;
        if (name == "WARN")
            return spdlog::level::warn;
        if (name == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info;
    }
};
