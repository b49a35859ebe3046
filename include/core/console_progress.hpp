#pragma once

#include "core/pipeline_runner.hpp"
#include <mutex>
#include <ostream>
#include <string>

/**
 * @brief Single rewritten terminal line showing "[<percent>%] <status>"
 *
 * Progress and status arrive from the worker on separate callbacks; each
 * redraw keeps the latest value of the other.
 */
class ConsoleProgress
{
public:
    explicit ConsoleProgress(std::ostream &out) : out_(out), last_percent_(0) {}

    void onProgress(int percent)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_percent_ = percent;
        redraw();
    }

    void onStatus(const std::string &status)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_status_ = status;
        redraw();
    }

    // Callbacks bound to this instance, which must outlive the run
    RunCallbacks callbacks()
    {
        RunCallbacks callbacks;
        callbacks.on_progress = [this](int percent)
        { onProgress(percent); };
        callbacks.on_status = [this](const std::string &status)
        { onStatus(status); };
        return callbacks;
    }

private:
    void redraw()
    {
        out_ << "\r\033[K[" << last_percent_ << "%] " << last_status_ << std::flush;
    }

    std::ostream &out_;
    std::mutex mutex_;
    int last_percent_;
    std::string last_status_;
};
