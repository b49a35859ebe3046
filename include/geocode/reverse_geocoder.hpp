#pragma once

#include <string>

/**
 * @brief Structured address returned by a reverse-geocoding service
 */
struct GeoAddress
{
    std::string poi;     // point-of-interest or landmark name
    std::string city;
    std::string region;  // state, province or county
    std::string country;

    bool empty() const
    {
        return poi.empty() && city.empty() && region.empty() && country.empty();
    }
};

struct GeocodeLookupResult
{
    bool success;
    std::string error_message;
    GeoAddress address;

    GeocodeLookupResult() : success(false) {}
    GeocodeLookupResult(const GeoAddress &addr) : success(true), address(addr) {}
    GeocodeLookupResult(bool s, const std::string &msg) : success(s), error_message(msg) {}
};

/**
 * @brief Reverse-geocoding collaborator
 *
 * Implementations report timeouts and service errors through
 * GeocodeLookupResult::success and must not throw.
 */
class ReverseGeocoder
{
public:
    virtual ~ReverseGeocoder() = default;
    virtual GeocodeLookupResult reverse(double latitude, double longitude) = 0;
};
