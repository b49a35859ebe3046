#include <gtest/gtest.h>
#include "core/poco_config_manager.hpp"
#include "test_base.hpp"
#include <fstream>

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().resetToDefaults();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().resetToDefaults();
        TestBase::TearDown();
    }
};

TEST_F(PocoConfigManagerTest, DefaultsAreUsable)
{
    auto &config = PocoConfigManager::getInstance();

    EXPECT_EQ(config.getDuplicateStrategy(), DuplicateStrategy::EXACT);
    EXPECT_EQ(config.getNamingConvention(), NamingConvention::DATE_LOCATION);
    EXPECT_EQ(config.getOutputDir(), "organized");
    EXPECT_EQ(config.getTrashDir(), "duplicates");
    EXPECT_EQ(config.getHashChunkSize(), 64u * 1024u);
    EXPECT_TRUE(config.isGeocodeEnabled());
    EXPECT_EQ(config.getGeocodeMaxAttempts(), 3);
    EXPECT_EQ(config.getGeocodeHost(), "https://nominatim.openstreetmap.org");
    EXPECT_EQ(config.getGeocodeCachePath(), "geocode_cache.json");
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, DefaultExtensionsCoverImagesAndVideos)
{
    auto &config = PocoConfigManager::getInstance();
    auto extensions = config.getEnabledExtensions();

    EXPECT_EQ(extensions.count("jpg"), 1u);
    EXPECT_EQ(extensions.count("heic"), 1u);
    EXPECT_EQ(extensions.count("mp4"), 1u);
    EXPECT_EQ(extensions.count("mov"), 1u);
    EXPECT_EQ(extensions.count("txt"), 0u);
    EXPECT_EQ(config.getEnabledVideoExtensions().size(), 5u);
}

TEST_F(PocoConfigManagerTest, LoadLayersFileOverDefaults)
{
    std::string file = createFile("config.json", R"({
        "organizer": {"duplicate_strategy": "perceptual", "naming_convention": "Dynamic"},
        "geocode": {"max_attempts": 5},
        "categories": {"video": {"wmv": false}}
    })");

    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(file));

    EXPECT_EQ(config.getDuplicateStrategy(), DuplicateStrategy::PERCEPTUAL);
    EXPECT_EQ(config.getNamingConvention(), NamingConvention::DYNAMIC);
    EXPECT_EQ(config.getGeocodeMaxAttempts(), 5);
    // Keys absent from the file keep their defaults
    EXPECT_EQ(config.getOutputDir(), "organized");
    EXPECT_EQ(config.getGeocodeBackoffMs(), 1000);
    EXPECT_EQ(config.getEnabledExtensions().count("wmv"), 0u);
    EXPECT_EQ(config.getEnabledExtensions().count("mkv"), 1u);
}

TEST_F(PocoConfigManagerTest, LoadRejectsMissingAndCorruptFiles)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load(path("absent.json")));

    std::string corrupt = createFile("corrupt.json", "{ not json");
    EXPECT_FALSE(config.load(corrupt));
    EXPECT_EQ(config.getDuplicateStrategy(), DuplicateStrategy::EXACT);
}

TEST_F(PocoConfigManagerTest, SaveThenLoadKeepsValues)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"organizer", {{"output_dir", "/srv/photos"}}}, {"geocode", {{"enabled", false}}}});
    std::string file = path("saved.json");
    ASSERT_TRUE(config.save(file));

    config.resetToDefaults();
    EXPECT_EQ(config.getOutputDir(), "organized");

    ASSERT_TRUE(config.load(file));
    EXPECT_EQ(config.getOutputDir(), "/srv/photos");
    EXPECT_FALSE(config.isGeocodeEnabled());
    EXPECT_EQ(config.getEnabledExtensions().count("jpg"), 1u);
}

TEST_F(PocoConfigManagerTest, ValidateFlagsUnknownValues)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"organizer", {{"duplicate_strategy", "fuzzy"}}}});
    EXPECT_FALSE(config.validateConfig());
    EXPECT_EQ(config.getDuplicateStrategy(), DuplicateStrategy::EXACT);

    config.resetToDefaults();
    config.update({{"organizer", {{"naming_convention", "Random"}}}});
    EXPECT_FALSE(config.validateConfig());
    EXPECT_EQ(config.getNamingConvention(), NamingConvention::DATE_LOCATION);
}

TEST_F(PocoConfigManagerTest, NonNumericIntegerFallsBackToDefault)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"geocode", {{"backoff_ms", "soon"}}}});
    EXPECT_EQ(config.getGeocodeBackoffMs(), 1000);
}

TEST_F(PocoConfigManagerTest, DisabledCategoriesLeaveNothingToClassify)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"categories",
                    {{"images", {{"jpg", false}, {"jpeg", false}, {"png", false}, {"tiff", false},
                                 {"tif", false}, {"bmp", false}, {"heic", false}}},
                     {"video", {{"mp4", false}, {"mov", false}, {"avi", false}, {"mkv", false}, {"wmv", false}}}}}});

    MediaExtensions extensions = config.getMediaExtensions();

    EXPECT_TRUE(extensions.images.empty());
    EXPECT_TRUE(extensions.videos.empty());
    EXPECT_EQ(extensions.classify("jpg"), MediaKind::UNSUPPORTED);
    EXPECT_EQ(extensions.classify("mp4"), MediaKind::UNSUPPORTED);
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, EnabledCategoryExtendsClassification)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"categories", {{"images", {{"webp", true}, {"bmp", false}}}}}});

    MediaExtensions extensions = config.getMediaExtensions();

    EXPECT_EQ(extensions.classify("webp"), MediaKind::IMAGE);
    EXPECT_EQ(extensions.classify("bmp"), MediaKind::UNSUPPORTED);
    EXPECT_EQ(extensions.classify("jpg"), MediaKind::IMAGE);
    EXPECT_EQ(extensions.classify("mkv"), MediaKind::VIDEO);
}
