#include "core/run_signal_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>

volatile sig_atomic_t RunSignalManager::cancel_flag_ = 0;
volatile sig_atomic_t RunSignalManager::pause_flag_ = 0;
volatile sig_atomic_t RunSignalManager::resume_flag_ = 0;
volatile sig_atomic_t RunSignalManager::signal_num_ = 0;

RunSignalManager &RunSignalManager::getInstance()
{
    static RunSignalManager instance;
    return instance;
}

RunSignalManager::~RunSignalManager()
{
    stopWatcher();
}

void RunSignalManager::attach(RunControls *controls)
{
    std::lock_guard<std::mutex> lk(mutex_);
    controls_ = controls;
}

void RunSignalManager::installSignalHandlers()
{
    signal(SIGINT, &RunSignalManager::handleSignal);
    signal(SIGTERM, &RunSignalManager::handleSignal);
    signal(SIGQUIT, &RunSignalManager::handleSignal);
    signal(SIGUSR1, &RunSignalManager::handleSignal);
    signal(SIGUSR2, &RunSignalManager::handleSignal);

    startWatcher();
    Logger::info("RunSignalManager: signal handlers installed (INT/TERM/QUIT cancel, USR1 pause, USR2 resume)");
}

void RunSignalManager::uninstallSignalHandlers()
{
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGQUIT, SIG_DFL);
    signal(SIGUSR1, SIG_DFL);
    signal(SIGUSR2, SIG_DFL);
    stopWatcher();
}

void RunSignalManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    switch (sig)
    {
    case SIGUSR1:
        pause_flag_ = 1;
        break;
    case SIGUSR2:
        resume_flag_ = 1;
        break;
    default:
        cancel_flag_ = 1;
        break;
    }
}

void RunSignalManager::dispatchPending()
{
    if (!cancel_flag_ && !pause_flag_ && !resume_flag_)
    {
        return;
    }

    // Capture and clear asap
    int sig = signal_num_;
    bool cancel = cancel_flag_ != 0;
    bool pause = pause_flag_ != 0;
    bool resume = resume_flag_ != 0;
    cancel_flag_ = 0;
    pause_flag_ = 0;
    resume_flag_ = 0;
    last_signal_.store(sig);

    std::lock_guard<std::mutex> lk(mutex_);
    if (cancel)
    {
        cancel_requested_.store(true);
        Logger::info("RunSignalManager: received signal " + std::to_string(sig) + ", cancelling run");
        if (controls_)
            controls_->cancel();
        return;
    }
    if (pause && controls_)
    {
        controls_->pause();
    }
    if (resume && controls_)
    {
        controls_->resume();
    }
}

void RunSignalManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            dispatchPending();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void RunSignalManager::stopWatcher()
{
    if (!watcher_running_.exchange(false))
    {
        return;
    }
    if (watcher_.joinable())
    {
        watcher_.join();
    }
}

void RunSignalManager::reset() noexcept
{
    stopWatcher();

    last_signal_.store(0);
    cancel_requested_.store(false);

    cancel_flag_ = 0;
    pause_flag_ = 0;
    resume_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    controls_ = nullptr;
}
