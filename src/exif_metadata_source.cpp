#include "core/exif_metadata_source.hpp"
#include "logging/logger.hpp"
#include <exiv2/exiv2.hpp>
#include <utility>
#include <vector>

namespace
{
    // Exiv2 key -> short tag name handed to MetadataResolver
    const std::vector<std::pair<std::string, std::string>> kExifTagMap = {
        {"Exif.Photo.DateTimeOriginal", "DateTimeOriginal"},
        {"Exif.Photo.DateTimeDigitized", "CreateDate"},
        {"Exif.Image.DateTime", "ModifyDate"},
        {"Exif.GPSInfo.GPSLatitude", "GPSLatitude"},
        {"Exif.GPSInfo.GPSLatitudeRef", "GPSLatitudeRef"},
        {"Exif.GPSInfo.GPSLongitude", "GPSLongitude"},
        {"Exif.GPSInfo.GPSLongitudeRef", "GPSLongitudeRef"},
    };

    // XMP fallbacks, used when the EXIF block lacks the tag (common for HEIC/PNG)
    const std::vector<std::pair<std::string, std::string>> kXmpTagMap = {
        {"Xmp.exif.DateTimeOriginal", "DateTimeOriginal"},
        {"Xmp.xmp.CreateDate", "CreateDate"},
        {"Xmp.xmp.ModifyDate", "ModifyDate"},
    };
}

ExifMetadataSource::ExifMetadataSource()
{
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
#ifdef EXV_ENABLE_BMFF
    // HEIC/AVIF/CR3 parsing is compiled in but off until enabled
    Exiv2::enableBMFF();
#endif
}

TagReadResult ExifMetadataSource::readTags(const std::string &file_path)
{
    try
    {
        auto image = Exiv2::ImageFactory::open(file_path);
        if (!image)
        {
            return TagReadResult(false, "Exiv2 could not open: " + file_path);
        }
        image->readMetadata();

        TagReadResult result(true);
        const auto &exif = image->exifData();
        for (const auto &mapping : kExifTagMap)
        {
            auto it = exif.findKey(Exiv2::ExifKey(mapping.first));
            if (it != exif.end())
            {
                std::string value = it->toString();
                if (!value.empty())
                {
                    result.tags[mapping.second] = value;
                }
            }
        }

        const auto &xmp = image->xmpData();
        for (const auto &mapping : kXmpTagMap)
        {
            if (result.tags.count(mapping.second) > 0)
                continue;
            auto it = xmp.findKey(Exiv2::XmpKey(mapping.first));
            if (it != xmp.end())
            {
                std::string value = it->toString();
                if (!value.empty())
                {
                    result.tags[mapping.second] = value;
                }
            }
        }

        Logger::trace("Exiv2 read " + std::to_string(result.tags.size()) + " tags from " + file_path);
        return result;
    }
    catch (const Exiv2::Error &e)
    {
        return TagReadResult(false, "Exiv2 error for " + file_path + ": " + e.what());
    }
    catch (const std::exception &e)
    {
        return TagReadResult(false, "Metadata read error for " + file_path + ": " + e.what());
    }
}
