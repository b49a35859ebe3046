#include "geocode/nominatim_geocoder.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <cstdio>
#include <thread>

namespace
{
    // Address classes whose "name" is a landmark rather than a street or a town
    const char *const kPoiClasses[] = {"tourism", "attraction", "amenity", "building", "leisure", "historic"};
    const char *const kCityKeys[] = {"city", "town", "village", "hamlet", "municipality"};
    const char *const kRegionKeys[] = {"state", "region", "province", "county"};

    std::string firstString(const nlohmann::json &obj, const char *const keys[], size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            auto it = obj.find(keys[i]);
            if (it != obj.end() && it->is_string() && !it->get<std::string>().empty())
                return it->get<std::string>();
        }
        return "";
    }
}

NominatimGeocoder::NominatimGeocoder(const NominatimSettings &settings)
    : settings_(settings), has_requested_(false)
{
}

void NominatimGeocoder::throttle()
{
    if (has_requested_ && settings_.min_interval_ms > 0)
    {
        auto next_allowed = last_request_ + std::chrono::milliseconds(settings_.min_interval_ms);
        auto now = std::chrono::steady_clock::now();
        if (now < next_allowed)
        {
            std::this_thread::sleep_for(next_allowed - now);
        }
    }
    last_request_ = std::chrono::steady_clock::now();
    has_requested_ = true;
}

GeocodeLookupResult NominatimGeocoder::reverse(double latitude, double longitude)
{
    std::lock_guard<std::mutex> lock(mutex_);
    throttle();

    char query[160];
    std::snprintf(query, sizeof(query), "/reverse?format=jsonv2&lat=%.6f&lon=%.6f&zoom=18&addressdetails=1",
                  latitude, longitude);
    std::string path = std::string(query) + "&accept-language=" + settings_.language;

    try
    {
        httplib::Client client(settings_.host);
        client.set_connection_timeout(settings_.timeout_seconds, 0);
        client.set_read_timeout(settings_.timeout_seconds, 0);
        client.set_follow_location(true);

        httplib::Headers headers = {{"User-Agent", settings_.user_agent}};
        Logger::debug("Nominatim request: " + settings_.host + path);
        auto res = client.Get(path.c_str(), headers);
        if (!res)
        {
            return GeocodeLookupResult(false, "Nominatim request failed: " + httplib::to_string(res.error()));
        }
        if (res->status != 200)
        {
            return GeocodeLookupResult(false, "Nominatim returned HTTP " + std::to_string(res->status));
        }
        return parseResponse(nlohmann::json::parse(res->body));
    }
    catch (const nlohmann::json::exception &e)
    {
        return GeocodeLookupResult(false, std::string("Invalid Nominatim response: ") + e.what());
    }
    catch (const std::exception &e)
    {
        return GeocodeLookupResult(false, std::string("Nominatim error: ") + e.what());
    }
}

GeocodeLookupResult NominatimGeocoder::parseResponse(const nlohmann::json &response)
{
    if (!response.is_object())
    {
        return GeocodeLookupResult(false, "Nominatim response is not an object");
    }
    if (response.contains("error"))
    {
        return GeocodeLookupResult(false, "Nominatim error: " + response["error"].dump());
    }

    GeoAddress address;
    auto addr_it = response.find("address");
    if (addr_it != response.end() && addr_it->is_object())
    {
        const auto &addr = *addr_it;
        address.city = firstString(addr, kCityKeys, sizeof(kCityKeys) / sizeof(kCityKeys[0]));
        address.region = firstString(addr, kRegionKeys, sizeof(kRegionKeys) / sizeof(kRegionKeys[0]));
        if (addr.contains("country") && addr["country"].is_string())
            address.country = addr["country"].get<std::string>();

        std::string landmark = firstString(addr, kPoiClasses, sizeof(kPoiClasses) / sizeof(kPoiClasses[0]));
        if (!landmark.empty())
        {
            address.poi = landmark;
        }
        else if (response.contains("name") && response["name"].is_string())
        {
            std::string category = response.value("category", "");
            for (const char *cls : kPoiClasses)
            {
                if (category == cls)
                {
                    address.poi = response["name"].get<std::string>();
                    break;
                }
            }
        }
    }
    return GeocodeLookupResult(address);
}
