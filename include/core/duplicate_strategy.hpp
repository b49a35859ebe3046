#pragma once

#include <string>

/**
 * @brief Fingerprinting strategies used for duplicate detection
 *
 * EXACT hashes the raw bytes, so any byte difference yields a new fingerprint.
 * PERCEPTUAL hashes decoded pixels and tolerates re-encoding and resizing.
 */
enum class DuplicateStrategy
{
    EXACT,     // SHA-256 over file content (OpenSSL)
    PERCEPTUAL // 64-bit DCT pHash over decoded image (OpenCV)
};

class DuplicateStrategies
{
public:
    /**
     * @brief Get the strategy tag used inside fingerprints and config
     * @param strategy The duplicate strategy
     * @return "exact" or "perceptual"
     */
    static std::string getName(DuplicateStrategy strategy)
    {
        switch (strategy)
        {
        case DuplicateStrategy::EXACT:
            return "exact";
        case DuplicateStrategy::PERCEPTUAL:
            return "perceptual";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Get the library stack behind a strategy
     * @param strategy The duplicate strategy
     * @return Human-readable description
     */
    static std::string getLibraryStack(DuplicateStrategy strategy)
    {
        switch (strategy)
        {
        case DuplicateStrategy::EXACT:
            return "OpenSSL (SHA-256)";
        case DuplicateStrategy::PERCEPTUAL:
            return "OpenCV (pHash)";
        default:
            return "Unknown strategy";
        }
    }

    /**
     * @brief Convert string to DuplicateStrategy enum
     * @param strategy_str "exact" or "perceptual", any case
     * @return DuplicateStrategy, EXACT when unrecognized
     */
    static DuplicateStrategy fromString(const std::string &strategy_str)
    {
        if (strategy_str == "PERCEPTUAL" || strategy_str == "perceptual" || strategy_str == "Perceptual")
            return DuplicateStrategy::PERCEPTUAL;
        return DuplicateStrategy::EXACT;
    }

    static bool isValid(const std::string &strategy_str)
    {
        return strategy_str == "exact" || strategy_str == "EXACT" || strategy_str == "Exact" ||
               strategy_str == "perceptual" || strategy_str == "PERCEPTUAL" || strategy_str == "Perceptual";
    }
};
