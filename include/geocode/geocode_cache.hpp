#pragma once

#include "core/media_types.hpp"
#include "core/retry_policy.hpp"
#include "geocode/geocode_cache_store.hpp"
#include "geocode/reverse_geocoder.hpp"
#include <mutex>
#include <optional>
#include <string>

/**
 * @brief Place label for a capture position
 */
struct ResolvedLocation
{
    std::string label;
    bool found;

    ResolvedLocation() : label("Unknown_Location"), found(false) {}
    ResolvedLocation(const std::string &l, bool f) : label(l), found(f) {}
};

/**
 * @brief Caching front for a ReverseGeocoder
 *
 * Coordinates are rounded to five decimals to form the cache key. A miss
 * goes to the geocoder under the retry policy and a usable label is stored
 * before it is returned. resolve() never fails: every error path degrades
 * to Unknown_Location with found=false.
 */
class GeocodeCache
{
public:
    static const char *const UNKNOWN_LOCATION;

    /**
     * @param geocoder Lookup service; nullptr disables lookups (cache only)
     * @param store Durable entries, owned by the cache from here on
     * @param retry Attempt budget and backoff for lookups
     */
    GeocodeCache(ReverseGeocoder *geocoder, GeocodeCacheStore store, const RetryPolicy &retry = RetryPolicy());

    ResolvedLocation resolve(const std::optional<GpsCoordinates> &coordinates);

    // "<lat>,<lon>" with five decimals, negative zero folded to zero
    static std::string makeKey(double latitude, double longitude);

    // poi, else "city, region, country" (non-empty parts), else empty
    static std::string labelFor(const GeoAddress &address);

    size_t size() const;

private:
    ReverseGeocoder *geocoder_;
    GeocodeCacheStore store_;
    RetryPolicy retry_;
    mutable std::mutex mutex_;
};
