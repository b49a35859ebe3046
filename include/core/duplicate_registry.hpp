#pragma once

#include "core/content_hasher.hpp"
#include <mutex>
#include <string>
#include <unordered_set>

enum class Classification
{
    ORIGINAL,
    DUPLICATE
};

/**
 * @brief Run-scoped record of fingerprints seen so far
 *
 * The first file with a given fingerprint is the original; every later file
 * with the same fingerprint is a duplicate. Nothing is persisted.
 */
class DuplicateRegistry
{
public:
    DuplicateRegistry() = default;

    /**
     * @brief Classify a fingerprint, recording it when unseen
     *
     * Check and insert happen under one lock so two equal fingerprints can
     * never both be reported as ORIGINAL.
     */
    Classification classify(const Fingerprint &fingerprint);

    bool contains(const Fingerprint &fingerprint) const;
    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> processed_set_;
};
