#include "core/container_metadata_source.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <initializer_list>

extern "C"
{
#include <libavutil/dict.h>
}

namespace
{
    std::string firstTag(AVDictionary *dict, std::initializer_list<const char *> keys)
    {
        if (!dict)
            return "";
        for (const char *key : keys)
        {
            AVDictionaryEntry *entry = av_dict_get(dict, key, nullptr, 0);
            if (entry && entry->value && entry->value[0] != '\0')
                return entry->value;
        }
        return "";
    }
}

TagReadResult ContainerMetadataSource::readTags(const std::string &file_path)
{
    AVFormatInputHandle input;
    std::string open_error;
    if (!input.open(file_path, open_error))
    {
        return TagReadResult(false, "Could not open video container: " + file_path + " - " + open_error);
    }

    TagReadResult result(true);
    AVFormatContext *ctx = input.get();

    std::string recorded = firstTag(ctx->metadata, {"com.apple.quicktime.creationdate", "date", "DATE_RECORDED"});
    if (!recorded.empty())
        result.tags["RecordedDate"] = recorded;

    for (unsigned int i = 0; i < ctx->nb_streams; ++i)
    {
        AVStream *stream = ctx->streams[i];
        if (stream && stream->codecpar && stream->codecpar->codec_type == AVMEDIA_TYPE_VIDEO)
        {
            std::string tagged = firstTag(stream->metadata, {"creation_time"});
            if (!tagged.empty())
                result.tags["TaggedDate"] = tagged;
            break;
        }
    }

    std::string encoded = firstTag(ctx->metadata, {"creation_time", "DATE_ENCODED"});
    if (!encoded.empty())
        result.tags["EncodedDate"] = encoded;

    Logger::trace("libavformat read " + std::to_string(result.tags.size()) + " date tags from " + file_path);
    return result;
}
