/**
 * @file signal_watcher.hpp
 * @brief SIGINT/SIGTERM handling for the interactive console
 *
 * Signals are blocked in every thread and consumed by one sigwait() thread,
 * so a process-directed signal is never delivered to an orchestrator worker.
 * The watcher then interrupts the console thread (SIGUSR1, installed without
 * SA_RESTART) so a blocked stdin read returns with EINTR.
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace breachlab {
namespace utils {

/**
 * @class SignalWatcher
 * @brief Turns SIGINT/SIGTERM into a console shutdown request
 *
 * Construct it on the console thread before any other thread exists: the
 * blocked mask is inherited by threads created afterwards. The destructor
 * must run on the same thread; it restores that thread's previous mask and
 * SIGUSR1 disposition.
 *
 * **Usage Example**:
 * @code
 * SignalWatcher signals;
 * orchestrator.Start();
 * while (!signals.StopRequested() && std::getline(std::cin, line)) { ... }
 * signals.ConsoleFinished();
 * @endcode
 */
class SignalWatcher {
public:
    SignalWatcher();
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// SIGINT or SIGTERM has been received
    bool StopRequested() const { return stop_requested_.load(); }

    /// The console loop has returned; stop interrupting it
    void ConsoleFinished();

private:
    void Run();
    void InterruptConsole();

    sigset_t waited_;
    sigset_t previous_mask_;
    struct sigaction previous_interrupt_action_;
    pthread_t console_thread_;
    std::thread thread_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> finished_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool console_done_{false};
};

} // namespace utils
} // namespace breachlab
