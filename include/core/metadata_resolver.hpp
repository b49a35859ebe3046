#pragma once

#include "core/media_types.hpp"
#include "core/metadata_source.hpp"
#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Result of a metadata extraction
 */
struct MetadataResult
{
    bool success;
    ErrorKind error_kind;
    std::string error_message;
    CaptureMetadata metadata;
    bool timestamp_from_filesystem; // true when no usable date tag existed

    MetadataResult() : success(false), error_kind(ErrorKind::NONE), timestamp_from_filesystem(false) {}
    MetadataResult(ErrorKind kind, const std::string &msg)
        : success(false), error_kind(kind), error_message(msg), timestamp_from_filesystem(false) {}
};

/**
 * @brief Derives capture timestamp and GPS position of a media file
 *
 * Images: DateTimeOriginal -> CreateDate -> ModifyDate -> file modification time.
 * Videos: RecordedDate -> TaggedDate -> EncodedDate; never carry GPS.
 * A source failure is reported as EXTRACTION_FAILURE; nothing is guessed.
 */
class MetadataResolver
{
public:
    MetadataResolver(MetadataSource &image_source, MetadataSource &video_source);

    MetadataResult extract(const MediaFile &file);

    /**
     * @brief Normalize a date string into "YYYY:MM:DD HH:MM:SS"
     *
     * Accepts EXIF ("2023:05:01 14:30:00"), ISO-8601 ("2023-05-01T14:30:00.000Z"),
     * and MediaInfo ("UTC 2023-05-01 14:30:00") forms. Zone and sub-second
     * suffixes are dropped. "0000:00:00 00:00:00" counts as absent.
     */
    static std::optional<std::string> normalizeTimestamp(const std::string &raw);

    /**
     * @brief Convert a GPS axis to signed decimal degrees
     * @param value Decimal, exiftool DMS (40 deg 48' 39.37" N), plain DMS
     *              (40 48 39.37) or rational triplet (40/1 48/1 3937/100)
     * @param ref Hemisphere reference: N/S/E/W or North/South/East/West
     * @return Degrees, negative for South and West; nullopt if unparseable
     */
    static std::optional<double> parseCoordinate(const std::string &value, const std::string &ref);

    // Local-time canonical form of a POSIX timestamp
    static std::string formatTimestamp(std::time_t t);

private:
    MetadataSource &image_source_;
    MetadataSource &video_source_;

    MetadataResult extractImage(const MediaFile &file);
    MetadataResult extractVideo(const MediaFile &file);
    static std::optional<std::string> firstTimestamp(const TagMap &tags, const char *const keys[], size_t count,
                                                     std::string *used_key);
    static std::optional<GpsCoordinates> extractGps(const TagMap &tags);
};
