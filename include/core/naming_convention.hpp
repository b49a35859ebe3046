#pragma once

#include <string>

/**
 * @brief Filename policies for organized media
 *
 * DATE_LOCATION -> 20230501_143000_Lincoln_USA.jpg
 * DATE          -> 20230501_143000.jpg
 * LOCATION      -> Lincoln_USA.jpg
 * DYNAMIC       -> DATE_LOCATION when the location was resolved, DATE otherwise
 */
enum class NamingConvention
{
    DATE_LOCATION,
    DATE,
    LOCATION,
    DYNAMIC
};

class NamingConventions
{
public:
    static std::string getName(NamingConvention convention)
    {
        switch (convention)
        {
        case NamingConvention::DATE_LOCATION:
            return "Date_Location";
        case NamingConvention::DATE:
            return "Date";
        case NamingConvention::LOCATION:
            return "Location";
        case NamingConvention::DYNAMIC:
            return "Dynamic";
        default:
            return "Date_Location";
        }
    }

    // Unrecognized names fall back to Date_Location
    static NamingConvention fromString(const std::string &name)
    {
        if (name == "Date" || name == "date" || name == "DATE")
            return NamingConvention::DATE;
        if (name == "Location" || name == "location" || name == "LOCATION")
            return NamingConvention::LOCATION;
        if (name == "Dynamic" || name == "dynamic" || name == "DYNAMIC")
            return NamingConvention::DYNAMIC;
        return NamingConvention::DATE_LOCATION;
    }
};
