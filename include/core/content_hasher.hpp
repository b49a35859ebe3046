#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/duplicate_strategy.hpp"
#include "core/media_types.hpp"

/**
 * @brief Content fingerprint used for duplicate comparison
 *
 * Two fingerprints identify the same content only when both the strategy
 * and the digest match.
 */
struct Fingerprint
{
    DuplicateStrategy strategy;
    std::string digest; // lowercase hex

    Fingerprint() : strategy(DuplicateStrategy::EXACT) {}
    Fingerprint(DuplicateStrategy s, const std::string &d) : strategy(s), digest(d) {}

    bool operator==(const Fingerprint &other) const
    {
        return strategy == other.strategy && digest == other.digest;
    }
    bool operator!=(const Fingerprint &other) const { return !(*this == other); }

    // "<strategy>:<digest>"
    std::string key() const;
};

/**
 * @brief Result of a fingerprint computation
 */
struct HashResult
{
    bool success;
    ErrorKind error_kind;
    std::string error_message;
    Fingerprint fingerprint;

    HashResult() : success(false), error_kind(ErrorKind::NONE) {}
    HashResult(const Fingerprint &fp) : success(true), error_kind(ErrorKind::NONE), fingerprint(fp) {}
    HashResult(ErrorKind kind, const std::string &msg)
        : success(false), error_kind(kind), error_message(msg) {}
};

/**
 * @brief Computes content fingerprints. Read-only; never touches the file.
 */
class ContentHasher
{
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    /**
     * @brief Fingerprint a file
     * @param file_path Path to the file
     * @param strategy EXACT (byte digest) or PERCEPTUAL (image pHash)
     * @param chunk_size Read size for the EXACT strategy
     * @return HashResult; IO_FAILURE when unreadable, UNSUPPORTED_CONTENT
     *         when PERCEPTUAL cannot decode the file as an image
     */
    static HashResult fingerprint(const std::string &file_path, DuplicateStrategy strategy,
                                  size_t chunk_size = DEFAULT_CHUNK_SIZE);

    static HashResult computeExactHash(const std::string &file_path, size_t chunk_size = DEFAULT_CHUNK_SIZE);
    static HashResult computePerceptualHash(const std::string &file_path);

    /**
     * @brief 64-bit DCT perceptual hash of an already decoded image
     * @param image BGR or grayscale image
     * @return 8 hash bytes, MSB first
     */
    static std::vector<uint8_t> generatePHash(const cv::Mat &image);

    static std::string toHex(const std::vector<uint8_t> &data);
};
