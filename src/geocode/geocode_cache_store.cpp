#include "geocode/geocode_cache_store.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace fs = std::filesystem;

GeocodeCacheStore::GeocodeCacheStore(const std::string &file_path)
    : file_path_(file_path)
{
    load();
}

void GeocodeCacheStore::load()
{
    if (file_path_.empty())
        return;

    std::error_code ec;
    if (!fs::exists(file_path_, ec))
    {
        Logger::debug("Geocode cache not found, starting empty: " + file_path_);
        return;
    }

    std::ifstream in(file_path_);
    if (!in.is_open())
    {
        Logger::warn("Could not open geocode cache, starting empty: " + file_path_);
        return;
    }

    try
    {
        nlohmann::json data = nlohmann::json::parse(in);
        if (!data.is_object())
        {
            Logger::warn("Geocode cache is not a JSON object, starting empty: " + file_path_);
            return;
        }
        for (auto it = data.begin(); it != data.end(); ++it)
        {
            if (it.value().is_string())
                entries_[it.key()] = it.value().get<std::string>();
        }
        Logger::info("Loaded " + std::to_string(entries_.size()) + " geocode cache entries from " + file_path_);
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("Geocode cache is corrupt, starting empty: " + file_path_ + " (" + e.what() + ")");
        entries_.clear();
    }
}

std::optional<std::string> GeocodeCacheStore::get(const std::string &key) const
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool GeocodeCacheStore::put(const std::string &key, const std::string &label)
{
    entries_[key] = label;
    return persist();
}

bool GeocodeCacheStore::persist() const
{
    if (file_path_.empty())
        return true;

    fs::path target(file_path_);
    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            Logger::error("Cannot create geocode cache directory " + target.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open())
        {
            Logger::error("Cannot write geocode cache: " + temp.string());
            return false;
        }
        nlohmann::json data(entries_);
        out << data.dump(2);
        if (!out.good())
        {
            Logger::error("Write failed for geocode cache: " + temp.string());
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec)
    {
        Logger::error("Cannot replace geocode cache " + target.string() + ": " + ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}
