#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Media category derived from the file extension
 */
enum class MediaKind
{
    IMAGE,
    VIDEO,
    UNSUPPORTED
};

/**
 * @brief Per-file error taxonomy used across the pipeline
 */
enum class ErrorKind
{
    NONE,
    IO_FAILURE,          // unreadable file
    EXTRACTION_FAILURE,  // metadata could not be read
    GEOCODE_FAILURE,     // reverse geocoding failed (never surfaced to the run)
    MOVE_FAILURE,        // destination not writable
    UNSUPPORTED_CONTENT  // extension or content not handled
};

class ErrorKinds
{
public:
    static std::string getName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::IO_FAILURE:
            return "IO_FAILURE";
        case ErrorKind::EXTRACTION_FAILURE:
            return "EXTRACTION_FAILURE";
        case ErrorKind::GEOCODE_FAILURE:
            return "GEOCODE_FAILURE";
        case ErrorKind::MOVE_FAILURE:
            return "MOVE_FAILURE";
        case ErrorKind::UNSUPPORTED_CONTENT:
            return "UNSUPPORTED_CONTENT";
        default:
            return "UNKNOWN";
        }
    }
};

class MediaKinds
{
public:
    static std::string getName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::IMAGE:
            return "image";
        case MediaKind::VIDEO:
            return "video";
        default:
            return "unsupported";
        }
    }
};

/**
 * @brief Gregorian calendar checks shared by timestamp parsers
 */
class CalendarDates
{
public:
    static bool isLeapYear(int year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    // 0 for an invalid month
    static int daysInMonth(int year, int month)
    {
        static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month < 1 || month > 12)
            return 0;
        if (month == 2 && isLeapYear(year))
            return 29;
        return kDays[month - 1];
    }

    static bool isValidDate(int year, int month, int day)
    {
        return day >= 1 && day <= daysInMonth(year, month);
    }
};

/**
 * @brief Snapshot of a source file taken at enumeration time
 */
struct MediaFile
{
    std::string path;              // absolute source path
    std::string extension;         // extension as found on disk, including the dot
    MediaKind kind;                // classification by extension
    uint64_t size_bytes;           // file size in bytes
    std::time_t modification_time; // last modification time (seconds since epoch)

    MediaFile() : kind(MediaKind::UNSUPPORTED), size_bytes(0), modification_time(0) {}

    std::string toString() const;
};

/**
 * @brief Signed decimal-degree coordinate pair
 */
struct GpsCoordinates
{
    double latitude;
    double longitude;

    GpsCoordinates() : latitude(0.0), longitude(0.0) {}
    GpsCoordinates(double lat, double lon) : latitude(lat), longitude(lon) {}
};

/**
 * @brief Capture timestamp and position of an original file
 */
struct CaptureMetadata
{
    std::optional<std::string> timestamp; // canonical "YYYY:MM:DD HH:MM:SS"
    std::optional<GpsCoordinates> gps;
};
