#include "geocode/geocode_cache.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <cstdio>
#include <utility>

const char *const GeocodeCache::UNKNOWN_LOCATION = "Unknown_Location";

GeocodeCache::GeocodeCache(ReverseGeocoder *geocoder, GeocodeCacheStore store, const RetryPolicy &retry)
    : geocoder_(geocoder), store_(std::move(store)), retry_(retry)
{
}

std::string GeocodeCache::makeKey(double latitude, double longitude)
{
    double lat = std::round(latitude * 100000.0) / 100000.0;
    double lon = std::round(longitude * 100000.0) / 100000.0;
    if (lat == 0.0)
        lat = 0.0;
    if (lon == 0.0)
        lon = 0.0;
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.5f,%.5f", lat, lon);
    return std::string(buffer);
}

std::string GeocodeCache::labelFor(const GeoAddress &address)
{
    if (!address.poi.empty())
        return address.poi;

    std::string label;
    for (const std::string *part : {&address.city, &address.region, &address.country})
    {
        if (part->empty())
            continue;
        if (!label.empty())
            label += ", ";
        label += *part;
    }
    return label;
}

ResolvedLocation GeocodeCache::resolve(const std::optional<GpsCoordinates> &coordinates)
{
    if (!coordinates)
        return ResolvedLocation(UNKNOWN_LOCATION, false);

    std::string key = makeKey(coordinates->latitude, coordinates->longitude);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = store_.get(key);
        if (cached)
        {
            Logger::debug("Geocode cache hit for " + key + ": " + *cached);
            return ResolvedLocation(*cached, true);
        }
    }

    if (!geocoder_)
    {
        Logger::debug("Geocoding disabled, no label for " + key);
        return ResolvedLocation(UNKNOWN_LOCATION, false);
    }

    // The lookup runs unlocked so retries and backoff never stall other workers
    double lat = coordinates->latitude;
    double lon = coordinates->longitude;
    GeocodeLookupResult lookup = retry_.run([&]()
                                            { return geocoder_->reverse(lat, lon); },
                                            "reverse geocode " + key);
    if (!lookup.success)
    {
        Logger::warn("Reverse geocoding failed for " + key + ", using " + UNKNOWN_LOCATION);
        return ResolvedLocation(UNKNOWN_LOCATION, false);
    }

    std::string label = labelFor(lookup.address);
    if (label.empty())
    {
        Logger::info("No usable address for " + key + ", not caching");
        return ResolvedLocation(UNKNOWN_LOCATION, false);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // First stored label wins when two workers looked up the same key
    auto stored = store_.get(key);
    if (stored)
        return ResolvedLocation(*stored, true);

    if (!store_.put(key, label))
    {
        Logger::warn("Geocode entry for " + key + " kept in memory only");
    }
    Logger::info("Resolved " + key + " to " + label);
    return ResolvedLocation(label, true);
}

size_t GeocodeCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.size();
}
