#pragma once

#include <map>
#include <optional>
#include <string>

/**
 * @brief Durable key -> label map persisted as a flat JSON object
 *
 * Loaded once at construction. A missing file starts empty; a corrupt or
 * non-object file also starts empty and is logged as a warning. Every put()
 * rewrites the file through a temporary sibling and a rename.
 */
class GeocodeCacheStore
{
public:
    // Empty path keeps the store in memory only
    explicit GeocodeCacheStore(const std::string &file_path = "");

    std::optional<std::string> get(const std::string &key) const;

    /**
     * @brief Insert an entry and persist the whole map
     * @return false if the file could not be written; the entry stays in memory
     */
    bool put(const std::string &key, const std::string &label);

    size_t size() const { return entries_.size(); }
    const std::string &getFilePath() const { return file_path_; }

private:
    std::string file_path_;
    std::map<std::string, std::string> entries_;

    void load();
    bool persist() const;
};
