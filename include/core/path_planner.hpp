#pragma once

#include "core/media_types.hpp"
#include "core/naming_convention.hpp"
#include "geocode/geocode_cache.hpp"
#include <ctime>
#include <optional>
#include <string>

/**
 * @brief Target directory and filename for an organized file
 */
struct Destination
{
    std::string directory; // <output_root>/<YYYY>/<YYYY>-<MM>
    std::string filename;  // stem plus the source extension, case preserved

    std::string fullPath() const;
};

/**
 * @brief Deterministic destination naming
 *
 * Pure: the same inputs always give the same Destination and nothing touches
 * the filesystem. Collisions are the Relocator's concern.
 */
class PathPlanner
{
public:
    /**
     * @brief Compute the destination of an original file
     * @param timestamp Canonical "YYYY:MM:DD HH:MM:SS"; absent or unparseable
     *                  values fall back to the source modification time
     * @param location Resolved place label
     * @param output_root Root of the organized tree
     * @param convention Filename policy
     * @param source Enumeration snapshot supplying mtime and extension
     */
    static Destination plan(const std::optional<std::string> &timestamp, const ResolvedLocation &location,
                            const std::string &output_root, NamingConvention convention, const MediaFile &source);

    // Spaces -> '_', commas dropped, path separators -> '_'
    static std::string sanitizeLocation(const std::string &label);

private:
    static bool parseTimestamp(const std::string &timestamp, std::tm &out);
};
