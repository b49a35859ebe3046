#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/duplicate_strategy.hpp"
#include "core/file_utils.hpp"
#include "core/naming_convention.hpp"

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Drop every change and reinstall the defaults
    void resetToDefaults();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFile() const;

    // Organizer
    DuplicateStrategy getDuplicateStrategy() const;
    NamingConvention getNamingConvention() const;
    std::string getOutputDir() const;
    std::string getTrashDir() const;
    size_t getHashChunkSize() const;

    // Geocoding
    bool isGeocodeEnabled() const;
    std::string getGeocodeCachePath() const;
    int getGeocodeMaxAttempts() const;
    int getGeocodeBackoffMs() const;
    int getGeocodeTimeoutSeconds() const;
    int getGeocodeMinIntervalMs() const;
    std::string getGeocodeHost() const;
    std::string getGeocodeUserAgent() const;
    std::string getGeocodeLanguage() const;

    // File type categories
    std::vector<std::string> getEnabledImageExtensions() const;
    std::vector<std::string> getEnabledVideoExtensions() const;
    std::set<std::string> getEnabledExtensions() const;

    // Enabled categories as the classification table; may be empty
    MediaExtensions getMediaExtensions() const;

    // Configuration validation
    bool validateConfig() const;

private:
    PocoConfigManager();
    void initializeDefaultConfig();
    void applyPatch(const nlohmann::json &patch);
    nlohmann::json getNestedConfig(const std::string &prefix) const;
    std::vector<std::string> getEnabledExtensionsForCategory(const std::string &category) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
