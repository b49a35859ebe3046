#include "core/duplicate_registry.hpp"
#include "logging/logger.hpp"

Classification DuplicateRegistry::classify(const Fingerprint &fingerprint)
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = processed_set_.insert(fingerprint.key()).second;
    if (!inserted)
    {
        Logger::debug("Fingerprint already seen: " + fingerprint.key());
        return Classification::DUPLICATE;
    }
    return Classification::ORIGINAL;
}

bool DuplicateRegistry::contains(const Fingerprint &fingerprint) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_set_.count(fingerprint.key()) > 0;
}

size_t DuplicateRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return processed_set_.size();
}

void DuplicateRegistry::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    processed_set_.clear();
}
