/**
 * @file signal_watcher.cpp
 * @brief sigwait() thread that shuts the console down on SIGINT/SIGTERM
 * @date 2025
 */

#include "breachlab/utils/signal_watcher.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace breachlab {
namespace utils {

namespace {

// Only exists to make a blocked read fail with EINTR
void HandleInterrupt(int) {}

} // anonymous namespace

SignalWatcher::SignalWatcher() : console_thread_(pthread_self()) {
    // SIGUSR2 only wakes the watcher for shutdown
    sigemptyset(&waited_);
    sigaddset(&waited_, SIGINT);
    sigaddset(&waited_, SIGTERM);
    sigaddset(&waited_, SIGUSR2);
    pthread_sigmask(SIG_BLOCK, &waited_, &previous_mask_);

    struct sigaction action {};
    action.sa_handler = HandleInterrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART
    sigaction(SIGUSR1, &action, &previous_interrupt_action_);

    thread_ = std::thread(&SignalWatcher::Run, this);
}

SignalWatcher::~SignalWatcher() {
    ConsoleFinished();
    finished_.store(true);
    pthread_kill(thread_.native_handle(), SIGUSR2);
    thread_.join();

    sigaction(SIGUSR1, &previous_interrupt_action_, nullptr);
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::ConsoleFinished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        console_done_ = true;
    }
    cv_.notify_all();
}

void SignalWatcher::Run() {
    while (true) {
        int signal_number = 0;
        if (sigwait(&waited_, &signal_number) != 0) {
            continue;
        }
        if (signal_number == SIGUSR2) {
            if (finished_.load()) {
                return;
            }
            continue;
        }
        if (stop_requested_.exchange(true)) {
            spdlog::warn("⚠ Shutdown already in progress");
            continue;
        }

        spdlog::info("Received {}, shutting down...", signal_number == SIGINT ? "SIGINT" : "SIGTERM");
        InterruptConsole();
    }
}

void SignalWatcher::InterruptConsole() {
    // Repeated because the signal can land just before the console blocks
    std::unique_lock<std::mutex> lock(mutex_);
    while (!console_done_) {
        pthread_kill(console_thread_, SIGUSR1);
        cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
}

} // namespace utils
} // namespace breachlab
