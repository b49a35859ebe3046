#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    std::vector<std::string> split(const std::string &s, char delim)
    {
        std::vector<std::string> parts;
        std::stringstream ss(s);
        std::string item;
        while (std::getline(ss, item, delim))
        {
            if (!item.empty())
                parts.push_back(item);
        }
        return parts;
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setString("log_file", "logs/media_organizer.log");

    // Organizer defaults
    cfg_->setString("organizer.duplicate_strategy", "exact");
    cfg_->setString("organizer.naming_convention", "Date_Location");
    cfg_->setString("organizer.output_dir", "organized");
    cfg_->setString("organizer.trash_dir", "duplicates");
    cfg_->setInt("hashing.chunk_size_bytes", 64 * 1024);

    // Geocoding defaults
    cfg_->setBool("geocode.enabled", true);
    cfg_->setString("geocode.cache_path", "geocode_cache.json");
    cfg_->setInt("geocode.max_attempts", 3);
    cfg_->setInt("geocode.backoff_ms", 1000);
    cfg_->setInt("geocode.timeout_seconds", 10);
    cfg_->setInt("geocode.min_interval_ms", 1000);
    cfg_->setString("geocode.host", "https://nominatim.openstreetmap.org");
    cfg_->setString("geocode.user_agent", "media_organizer/1.0");
    cfg_->setString("geocode.language", "en");

    // File type categories
    cfg_->setBool("categories.images.jpg", true);
    cfg_->setBool("categories.images.jpeg", true);
    cfg_->setBool("categories.images.png", true);
    cfg_->setBool("categories.images.tiff", true);
    cfg_->setBool("categories.images.tif", true);
    cfg_->setBool("categories.images.bmp", true);
    cfg_->setBool("categories.images.heic", true);

    cfg_->setBool("categories.video.mp4", true);
    cfg_->setBool("categories.video.mov", true);
    cfg_->setBool("categories.video.avi", true);
    cfg_->setBool("categories.video.mkv", true);
    cfg_->setBool("categories.video.wmv", true);
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    try
    {
        // Values from the file are layered over the defaults
        nlohmann::json file_config = nlohmann::json::parse(in);
        if (!file_config.is_object())
        {
            Logger::warn("Configuration file is not a JSON object: " + path);
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        applyPatch(file_config);
        return true;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.what());
        return false;
    }
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return out.good();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Configuration value for " + key + " is not an integer, using " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Configuration value for " + key + " is not a boolean, using default");
        return def;
    }
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getLogFile() const
{
    return getString("log_file", "logs/media_organizer.log");
}

DuplicateStrategy PocoConfigManager::getDuplicateStrategy() const
{
    return DuplicateStrategies::fromString(getString("organizer.duplicate_strategy", "exact"));
}

NamingConvention PocoConfigManager::getNamingConvention() const
{
    return NamingConventions::fromString(getString("organizer.naming_convention", "Date_Location"));
}

std::string PocoConfigManager::getOutputDir() const
{
    return getString("organizer.output_dir", "organized");
}

std::string PocoConfigManager::getTrashDir() const
{
    return getString("organizer.trash_dir", "duplicates");
}

size_t PocoConfigManager::getHashChunkSize() const
{
    int size = getInt("hashing.chunk_size_bytes", 64 * 1024);
    return size > 0 ? static_cast<size_t>(size) : static_cast<size_t>(64 * 1024);
}

bool PocoConfigManager::isGeocodeEnabled() const
{
    return getBool("geocode.enabled", true);
}

std::string PocoConfigManager::getGeocodeCachePath() const
{
    return getString("geocode.cache_path", "geocode_cache.json");
}

int PocoConfigManager::getGeocodeMaxAttempts() const
{
    return std::max(1, getInt("geocode.max_attempts", 3));
}

int PocoConfigManager::getGeocodeBackoffMs() const
{
    return std::max(0, getInt("geocode.backoff_ms", 1000));
}

int PocoConfigManager::getGeocodeTimeoutSeconds() const
{
    return std::max(1, getInt("geocode.timeout_seconds", 10));
}

int PocoConfigManager::getGeocodeMinIntervalMs() const
{
    return std::max(0, getInt("geocode.min_interval_ms", 1000));
}

std::string PocoConfigManager::getGeocodeHost() const
{
    return getString("geocode.host", "https://nominatim.openstreetmap.org");
}

std::string PocoConfigManager::getGeocodeUserAgent() const
{
    return getString("geocode.user_agent", "media_organizer/1.0");
}

std::string PocoConfigManager::getGeocodeLanguage() const
{
    return getString("geocode.language", "en");
}

nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    try
    {
        std::stringstream ss;
        cfg_->save(ss);
        auto current = nlohmann::json::parse(ss.str());

        for (const auto &key : split(prefix, '.'))
        {
            if (current.contains(key) && current[key].is_object())
            {
                current = current[key];
            }
            else
            {
                return nlohmann::json::object();
            }
        }
        return current;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Could not read configuration section " + prefix + ": " + e.what());
        return nlohmann::json::object();
    }
}

std::vector<std::string> PocoConfigManager::getEnabledExtensionsForCategory(const std::string &category) const
{
    std::vector<std::string> enabled_extensions;
    auto section = getNestedConfig("categories." + category);
    for (auto it = section.begin(); it != section.end(); ++it)
    {
        bool enabled = false;
        if (it.value().is_boolean())
            enabled = it.value().get<bool>();
        else if (it.value().is_string())
            enabled = it.value().get<std::string>() == "true";
        if (enabled)
        {
            std::string ext = it.key();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            enabled_extensions.push_back(ext);
        }
    }
    std::sort(enabled_extensions.begin(), enabled_extensions.end());
    return enabled_extensions;
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    return getEnabledExtensionsForCategory("images");
}

std::vector<std::string> PocoConfigManager::getEnabledVideoExtensions() const
{
    return getEnabledExtensionsForCategory("video");
}

std::set<std::string> PocoConfigManager::getEnabledExtensions() const
{
    std::set<std::string> enabled;
    for (const auto &ext : getEnabledImageExtensions())
        enabled.insert(ext);
    for (const auto &ext : getEnabledVideoExtensions())
        enabled.insert(ext);
    return enabled;
}

MediaExtensions PocoConfigManager::getMediaExtensions() const
{
    MediaExtensions extensions;
    extensions.images = getEnabledImageExtensions();
    extensions.videos = getEnabledVideoExtensions();
    return extensions;
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;
    std::string strategy = getString("organizer.duplicate_strategy", "exact");
    if (!DuplicateStrategies::isValid(strategy))
    {
        Logger::warn("Unknown duplicate strategy '" + strategy + "', exact will be used");
        valid = false;
    }
    std::string naming = getString("organizer.naming_convention", "Date_Location");
    if (NamingConventions::getName(NamingConventions::fromString(naming)) != naming)
    {
        Logger::warn("Unknown naming convention '" + naming + "', Date_Location will be used");
        valid = false;
    }
    if (getEnabledExtensions().empty())
    {
        Logger::warn("No file types enabled under categories");
        valid = false;
    }
    return valid;
}
