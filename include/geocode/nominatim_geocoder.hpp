#pragma once

#include "geocode/reverse_geocoder.hpp"
#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

struct NominatimSettings
{
    std::string host = "https://nominatim.openstreetmap.org";
    std::string user_agent = "media_organizer/1.0";
    std::string language = "en";
    int timeout_seconds = 10;
    int min_interval_ms = 1000; // public instance allows one request per second
};

/**
 * @brief ReverseGeocoder against a Nominatim-compatible /reverse endpoint
 */
class NominatimGeocoder : public ReverseGeocoder
{
public:
    explicit NominatimGeocoder(const NominatimSettings &settings);

    GeocodeLookupResult reverse(double latitude, double longitude) override;

    /**
     * @brief Map a jsonv2 /reverse response onto a GeoAddress
     * @param response Parsed response body
     * @return Lookup result; fails when the body carries an "error" member
     */
    static GeocodeLookupResult parseResponse(const nlohmann::json &response);

private:
    NominatimSettings settings_;
    std::mutex mutex_;
    std::chrono::steady_clock::time_point last_request_;
    bool has_requested_;

    void throttle();
};
