#include "core/run_controls.hpp"
#include "logging/logger.hpp"

void RunControls::pause()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        paused_.store(true);
    }
    cv_.notify_all();
    Logger::info("Pause requested");
}

void RunControls::resume()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        paused_.store(false);
    }
    cv_.notify_all();
    Logger::info("Resume requested");
}

void RunControls::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
    Logger::info("Cancel requested");
}

bool RunControls::waitWhilePaused()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return !paused_.load() || cancelled_.load(); });
    return !cancelled_.load();
}

void RunControls::reset() noexcept
{
    std::lock_guard<std::mutex> lk(mutex_);
    paused_.store(false);
    cancelled_.store(false);
}
