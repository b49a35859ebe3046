#include "core/metadata_resolver.hpp"
#include "logging/logger.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <regex>
#include <stdexcept>
#include <vector>

namespace
{
    const char *const kImageDateTags[] = {"DateTimeOriginal", "CreateDate", "ModifyDate"};
    const char *const kVideoDateTags[] = {"RecordedDate", "TaggedDate", "EncodedDate"};

    std::string trim(const std::string &s)
    {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
            ++start;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
            --end;
        return s.substr(start, end - start);
    }

    // Parses "12.5" or "3937/100"; rejects trailing garbage and zero denominators
    std::optional<double> parseNumberToken(const std::string &token)
    {
        try
        {
            size_t slash = token.find('/');
            if (slash != std::string::npos)
            {
                std::string num_str = token.substr(0, slash);
                std::string den_str = token.substr(slash + 1);
                size_t num_pos = 0, den_pos = 0;
                double num = std::stod(num_str, &num_pos);
                double den = std::stod(den_str, &den_pos);
                if (num_pos != num_str.size() || den_pos != den_str.size() || den == 0.0)
                    return std::nullopt;
                return num / den;
            }
            size_t pos = 0;
            double value = std::stod(token, &pos);
            if (pos != token.size())
                return std::nullopt;
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
        catch (const std::out_of_range &)
        {
            return std::nullopt;
        }
    }

    std::optional<double> combineDms(const std::vector<double> &parts)
    {
        // A lone decimal, or a full degrees/minutes/seconds triple
        if (parts.size() != 1 && parts.size() != 3)
            return std::nullopt;
        double degrees = parts[0];
        double minutes = parts.size() > 1 ? parts[1] : 0.0;
        double seconds = parts.size() > 2 ? parts[2] : 0.0;
        if (minutes < 0.0 || minutes >= 60.0 || seconds < 0.0 || seconds > 60.0)
            return std::nullopt;
        double magnitude = std::fabs(degrees) + minutes / 60.0 + seconds / 3600.0;
        return degrees < 0.0 ? -magnitude : magnitude;
    }

    bool isDigits(const std::string &s, size_t pos, size_t len)
    {
        for (size_t i = pos; i < pos + len; ++i)
        {
            if (!std::isdigit(static_cast<unsigned char>(s[i])))
                return false;
        }
        return true;
    }
}

MetadataResolver::MetadataResolver(MetadataSource &image_source, MetadataSource &video_source)
    : image_source_(image_source), video_source_(video_source)
{
}

MetadataResult MetadataResolver::extract(const MediaFile &file)
{
    switch (file.kind)
    {
    case MediaKind::IMAGE:
        return extractImage(file);
    case MediaKind::VIDEO:
        return extractVideo(file);
    default:
        return MetadataResult(ErrorKind::UNSUPPORTED_CONTENT, "No metadata source for: " + file.path);
    }
}

MetadataResult MetadataResolver::extractImage(const MediaFile &file)
{
    TagReadResult read = image_source_.readTags(file.path);
    if (!read.success)
    {
        return MetadataResult(ErrorKind::EXTRACTION_FAILURE,
                              "Metadata extraction failed (" + image_source_.getName() + "): " + read.error_message);
    }

    MetadataResult result;
    result.success = true;

    std::string used_key;
    result.metadata.timestamp = firstTimestamp(read.tags, kImageDateTags, 3, &used_key);
    if (result.metadata.timestamp)
    {
        Logger::debug("Timestamp from " + used_key + " for " + file.path + ": " + *result.metadata.timestamp);
    }
    else
    {
        result.metadata.timestamp = formatTimestamp(file.modification_time);
        result.timestamp_from_filesystem = true;
        Logger::debug("No date tags in " + file.path + ", using modification time " + *result.metadata.timestamp);
    }

    result.metadata.gps = extractGps(read.tags);
    return result;
}

MetadataResult MetadataResolver::extractVideo(const MediaFile &file)
{
    TagReadResult read = video_source_.readTags(file.path);
    if (!read.success)
    {
        return MetadataResult(ErrorKind::EXTRACTION_FAILURE,
                              "Metadata extraction failed (" + video_source_.getName() + "): " + read.error_message);
    }

    MetadataResult result;
    result.success = true;

    std::string used_key;
    result.metadata.timestamp = firstTimestamp(read.tags, kVideoDateTags, 3, &used_key);
    if (!result.metadata.timestamp)
    {
        result.timestamp_from_filesystem = true;
        Logger::debug("No container dates in " + file.path + ", destination will use modification time");
    }
    return result;
}

std::optional<std::string> MetadataResolver::firstTimestamp(const TagMap &tags, const char *const keys[], size_t count,
                                                            std::string *used_key)
{
    for (size_t i = 0; i < count; ++i)
    {
        auto it = tags.find(keys[i]);
        if (it == tags.end())
            continue;
        auto normalized = normalizeTimestamp(it->second);
        if (normalized)
        {
            if (used_key)
                *used_key = keys[i];
            return normalized;
        }
        Logger::debug(std::string("Ignoring unparseable ") + keys[i] + " value: " + it->second);
    }
    return std::nullopt;
}

std::optional<GpsCoordinates> MetadataResolver::extractGps(const TagMap &tags)
{
    auto lat_it = tags.find("GPSLatitude");
    auto lon_it = tags.find("GPSLongitude");
    if (lat_it == tags.end() || lon_it == tags.end())
        return std::nullopt;

    auto lat_ref_it = tags.find("GPSLatitudeRef");
    auto lon_ref_it = tags.find("GPSLongitudeRef");
    std::string lat_ref = lat_ref_it != tags.end() ? lat_ref_it->second : "";
    std::string lon_ref = lon_ref_it != tags.end() ? lon_ref_it->second : "";

    auto lat = parseCoordinate(lat_it->second, lat_ref);
    auto lon = parseCoordinate(lon_it->second, lon_ref);
    if (!lat || !lon)
    {
        Logger::debug("Unparseable GPS position: " + lat_it->second + " / " + lon_it->second);
        return std::nullopt;
    }
    if (std::fabs(*lat) > 90.0 || std::fabs(*lon) > 180.0)
    {
        Logger::debug("GPS position out of range: " + std::to_string(*lat) + ", " + std::to_string(*lon));
        return std::nullopt;
    }
    return GpsCoordinates(*lat, *lon);
}

std::optional<std::string> MetadataResolver::normalizeTimestamp(const std::string &raw)
{
    std::string text = trim(raw);
    if (text.compare(0, 4, "UTC ") == 0)
        text = trim(text.substr(4));
    if (text.size() < 19)
        return std::nullopt;

    std::string s = text.substr(0, 19);
    bool shape_ok = isDigits(s, 0, 4) && (s[4] == ':' || s[4] == '-') &&
                    isDigits(s, 5, 2) && s[7] == s[4] &&
                    isDigits(s, 8, 2) && (s[10] == ' ' || s[10] == 'T') &&
                    isDigits(s, 11, 2) && s[13] == ':' &&
                    isDigits(s, 14, 2) && s[16] == ':' &&
                    isDigits(s, 17, 2);
    if (!shape_ok)
        return std::nullopt;

    int year = std::stoi(s.substr(0, 4));
    int month = std::stoi(s.substr(5, 2));
    int day = std::stoi(s.substr(8, 2));
    int hour = std::stoi(s.substr(11, 2));
    int minute = std::stoi(s.substr(14, 2));
    int second = std::stoi(s.substr(17, 2));
    if (year < 1 || !CalendarDates::isValidDate(year, month, day) ||
        hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    char buffer[20];
    std::snprintf(buffer, sizeof(buffer), "%04d:%02d:%02d %02d:%02d:%02d", year, month, day, hour, minute, second);
    return std::string(buffer);
}

std::optional<double> MetadataResolver::parseCoordinate(const std::string &value, const std::string &ref)
{
    std::string text = trim(value);
    if (text.empty())
        return std::nullopt;

    char hemisphere = 0;
    std::string ref_text = trim(ref);
    if (!ref_text.empty())
    {
        hemisphere = static_cast<char>(std::toupper(static_cast<unsigned char>(ref_text[0])));
        if (hemisphere != 'N' && hemisphere != 'S' && hemisphere != 'E' && hemisphere != 'W')
            return std::nullopt;
    }

    // exiftool appends the hemisphere to the value itself
    char last = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    if (last == 'N' || last == 'S' || last == 'E' || last == 'W')
    {
        if (hemisphere == 0)
            hemisphere = last;
        text = trim(text.substr(0, text.size() - 1));
    }

    std::optional<double> degrees;
    if (text.find("deg") != std::string::npos)
    {
        static const std::regex dms_pattern(R"(^(-?\d+(?:\.\d+)?)\s*deg\s*(\d+(?:\.\d+)?)'\s*(\d+(?:\.\d+)?)\"?$)");
        std::smatch match;
        if (!std::regex_match(text, match, dms_pattern))
            return std::nullopt;
        degrees = combineDms({std::stod(match[1].str()), std::stod(match[2].str()), std::stod(match[3].str())});
    }
    else
    {
        std::vector<double> parts;
        std::string token;
        for (size_t i = 0; i <= text.size(); ++i)
        {
            char c = i < text.size() ? text[i] : ' ';
            if (std::isspace(static_cast<unsigned char>(c)) || c == ',')
            {
                if (!token.empty())
                {
                    auto number = parseNumberToken(token);
                    if (!number)
                        return std::nullopt;
                    parts.push_back(*number);
                    token.clear();
                }
            }
            else
            {
                token.push_back(c);
            }
        }
        degrees = combineDms(parts);
    }

    if (!degrees)
        return std::nullopt;
    if (hemisphere == 'S' || hemisphere == 'W')
        return -std::fabs(*degrees);
    return *degrees;
}

std::string MetadataResolver::formatTimestamp(std::time_t t)
{
    std::tm local_tm{};
    localtime_r(&t, &local_tm);
    char buffer[20];
    std::strftime(buffer, sizeof(buffer), "%Y:%m:%d %H:%M:%S", &local_tm);
    return std::string(buffer);
}
