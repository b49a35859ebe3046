#pragma once

#include <map>
#include <string>

/**
 * @brief Flat tag name -> value mapping produced by a metadata source
 *
 * Image sources provide DateTimeOriginal, CreateDate, ModifyDate and the
 * GPSLatitude / GPSLatitudeRef / GPSLongitude / GPSLongitudeRef fields.
 * Video sources provide RecordedDate, TaggedDate and EncodedDate.
 */
using TagMap = std::map<std::string, std::string>;

struct TagReadResult
{
    bool success;
    std::string error_message;
    TagMap tags;

    TagReadResult() : success(false) {}
    TagReadResult(bool s, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Metadata-extraction collaborator
 *
 * Implementations must not throw; failures are reported through
 * TagReadResult::success.
 */
class MetadataSource
{
public:
    virtual ~MetadataSource() = default;
    virtual TagReadResult readTags(const std::string &file_path) = 0;
    virtual std::string getName() const = 0;
};
