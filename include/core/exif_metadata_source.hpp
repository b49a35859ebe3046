#pragma once

#include "core/metadata_source.hpp"

/**
 * @brief Image metadata source backed by Exiv2
 *
 * Maps Exif.Photo.DateTimeOriginal -> DateTimeOriginal,
 * Exif.Photo.DateTimeDigitized -> CreateDate, Exif.Image.DateTime -> ModifyDate
 * and the Exif.GPSInfo position tags to their short names. GPS positions are
 * emitted as rational triplets ("40/1 48/1 3937/100").
 */
class ExifMetadataSource : public MetadataSource
{
public:
    ExifMetadataSource();

    TagReadResult readTags(const std::string &file_path) override;
    std::string getName() const override { return "exiv2"; }
};
