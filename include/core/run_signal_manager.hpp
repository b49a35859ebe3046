#pragma once

#include "core/run_controls.hpp"
#include <atomic>
#include <csignal>
#include <mutex>
#include <thread>

/**
 * Process-wide bridge from POSIX signals to RunControls.
 * - SIGINT/SIGTERM/SIGQUIT cancel the run, SIGUSR1 pauses, SIGUSR2 resumes
 * - Handlers only set sig_atomic_t flags; a watcher thread applies them
 */
class RunSignalManager
{
public:
    static RunSignalManager &getInstance();

    // Route signals to the given controls (nullptr detaches)
    void attach(RunControls *controls);

    // Install signal handlers and start internal watcher thread
    void installSignalHandlers();

    // Restore default dispositions and stop the watcher
    void uninstallSignalHandlers();

    int getLastSignal() const noexcept { return last_signal_.load(); }
    bool isCancelRequested() const noexcept { return cancel_requested_.load(); }

    // Reset state for testing purposes
    void reset() noexcept;

private:
    RunSignalManager() = default;
    ~RunSignalManager();
    RunSignalManager(const RunSignalManager &) = delete;
    RunSignalManager &operator=(const RunSignalManager &) = delete;

    // Async-signal-safe handler (sets only sig_atomic_t flags)
    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();
    void dispatchPending();

    std::atomic<int> last_signal_{0};
    std::atomic<bool> cancel_requested_{false};
    mutable std::mutex mutex_;
    RunControls *controls_ = nullptr;

    // Watcher thread
    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    // Async-signal-safe flags
    static volatile sig_atomic_t cancel_flag_;
    static volatile sig_atomic_t pause_flag_;
    static volatile sig_atomic_t resume_flag_;
    static volatile sig_atomic_t signal_num_;
};
