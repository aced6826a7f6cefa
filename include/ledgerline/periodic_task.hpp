#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include "logging.hpp"

namespace ledgerline {

/**
 * Runs a callback on a background thread every interval until stopped.
 * Errors thrown by the callback are logged and the loop continues.
 */
class PeriodicTask {
public:
    PeriodicTask(Logger& logger, std::string name, std::chrono::milliseconds interval,
                 std::function<void()> tick);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

private:
    void run();

    Logger& logger_;
    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> tick_;
    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace ledgerline
