#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

/**
 * @brief Cooperative pause / cancel flags shared with a pipeline worker
 *
 * The controlling side flips the flags from any thread; the worker calls
 * waitWhilePaused() at each file boundary.
 */
class RunControls
{
public:
    RunControls() = default;
    RunControls(const RunControls &) = delete;
    RunControls &operator=(const RunControls &) = delete;

    void pause();
    void resume();
    void cancel();

    bool isPaused() const noexcept { return paused_.load(); }
    bool isCancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Block while paused
     * @return true if the run may continue, false once cancelled
     */
    bool waitWhilePaused();

    // Clear both flags before a new run
    void reset() noexcept;

private:
    std::atomic<bool> paused_{false};
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
