#include "core/path_planner.hpp"
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

std::string Destination::fullPath() const
{
    return (fs::path(directory) / filename).string();
}

bool PathPlanner::parseTimestamp(const std::string &timestamp, std::tm &out)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char trailing = 0;
    int matched = std::sscanf(timestamp.c_str(), "%4d:%2d:%2d %2d:%2d:%2d%c",
                              &year, &month, &day, &hour, &minute, &second, &trailing);
    if (matched != 6)
        return false;
    if (year < 1 || !CalendarDates::isValidDate(year, month, day) || hour < 0 || hour > 23 ||
        minute < 0 || minute > 59 || second < 0 || second > 60)
        return false;

    out = std::tm{};
    out.tm_year = year - 1900;
    out.tm_mon = month - 1;
    out.tm_mday = day;
    out.tm_hour = hour;
    out.tm_min = minute;
    out.tm_sec = second;
    return true;
}

std::string PathPlanner::sanitizeLocation(const std::string &label)
{
    std::string result;
    result.reserve(label.size());
    for (char c : label)
    {
        if (c == ',')
            continue;
        if (c == ' ' || c == '/' || c == '\\')
            result.push_back('_');
        else
            result.push_back(c);
    }
    return result;
}

Destination PathPlanner::plan(const std::optional<std::string> &timestamp, const ResolvedLocation &location,
                              const std::string &output_root, NamingConvention convention, const MediaFile &source)
{
    std::tm when{};
    if (!timestamp || !parseTimestamp(*timestamp, when))
    {
        std::time_t mtime = source.modification_time;
        localtime_r(&mtime, &when);
    }

    char year[8];
    char month_dir[16];
    char date_stem[32];
    std::strftime(year, sizeof(year), "%Y", &when);
    std::strftime(month_dir, sizeof(month_dir), "%Y-%m", &when);
    std::strftime(date_stem, sizeof(date_stem), "%Y%m%d_%H%M%S", &when);

    std::string place = location.found ? sanitizeLocation(location.label) : GeocodeCache::UNKNOWN_LOCATION;

    std::string stem;
    switch (convention)
    {
    case NamingConvention::DATE:
        stem = date_stem;
        break;
    case NamingConvention::LOCATION:
        stem = place;
        break;
    case NamingConvention::DYNAMIC:
        stem = location.found ? std::string(date_stem) + "_" + place : std::string(date_stem);
        break;
    case NamingConvention::DATE_LOCATION:
    default:
        stem = std::string(date_stem) + "_" + place;
        break;
    }

    Destination dest;
    dest.directory = (fs::path(output_root) / year / month_dir).string();
    dest.filename = stem + source.extension;
    return dest;
}
