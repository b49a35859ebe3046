#pragma once

#include "core/metadata_source.hpp"

/**
 * @brief Video metadata source backed by FFmpeg's libavformat
 *
 * Reads container-level tags only (no stream decoding):
 *   RecordedDate <- com.apple.quicktime.creationdate | date | DATE_RECORDED
 *   TaggedDate   <- creation_time of the first video stream
 *   EncodedDate  <- container creation_time | DATE_ENCODED
 */
class ContainerMetadataSource : public MetadataSource
{
public:
    TagReadResult readTags(const std::string &file_path) override;
    std::string getName() const override { return "libavformat"; }
};
