#include <gtest/gtest.h>
#include "geocode/nominatim_geocoder.hpp"
#include <nlohmann/json.hpp>

TEST(NominatimGeocoderTest, ParsesCityRegionCountry)
{
    auto response = nlohmann::json::parse(R"({
        "category": "place",
        "name": "",
        "address": {
            "city": "Lincoln",
            "county": "Lancaster County",
            "state": "Nebraska",
            "country": "United States"
        }
    })");

    auto result = NominatimGeocoder::parseResponse(response);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.address.poi, "");
    EXPECT_EQ(result.address.city, "Lincoln");
    EXPECT_EQ(result.address.region, "Nebraska");
    EXPECT_EQ(result.address.country, "United States");
}

TEST(NominatimGeocoderTest, TownAndVillageCountAsCity)
{
    auto response = nlohmann::json::parse(R"({"address": {"village": "Hallstatt", "country": "Austria"}})");

    auto result = NominatimGeocoder::parseResponse(response);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.address.city, "Hallstatt");
    EXPECT_EQ(result.address.region, "");
}

TEST(NominatimGeocoderTest, LandmarkBecomesPoi)
{
    auto by_address = nlohmann::json::parse(R"({
        "category": "tourism",
        "name": "Eiffel Tower",
        "address": {"tourism": "Tour Eiffel", "city": "Paris", "country": "France"}
    })");
    auto by_category = nlohmann::json::parse(R"({
        "category": "historic",
        "name": "Old Bridge",
        "address": {"city": "Mostar", "country": "Bosnia and Herzegovina"}
    })");

    EXPECT_EQ(NominatimGeocoder::parseResponse(by_address).address.poi, "Tour Eiffel");
    EXPECT_EQ(NominatimGeocoder::parseResponse(by_category).address.poi, "Old Bridge");
}

TEST(NominatimGeocoderTest, StreetNameIsNotPoi)
{
    auto response = nlohmann::json::parse(R"({
        "category": "highway",
        "name": "Main Street",
        "address": {"road": "Main Street", "town": "Springfield", "country": "USA"}
    })");

    auto result = NominatimGeocoder::parseResponse(response);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.address.poi, "");
    EXPECT_EQ(result.address.city, "Springfield");
}

TEST(NominatimGeocoderTest, ErrorBodyFails)
{
    auto response = nlohmann::json::parse(R"({"error": "Unable to geocode"})");

    auto result = NominatimGeocoder::parseResponse(response);

    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("Unable to geocode"), std::string::npos);
    EXPECT_FALSE(NominatimGeocoder::parseResponse(nlohmann::json::array()).success);
}
