#include "ledgerline/periodic_task.hpp"

#include <exception>

namespace ledgerline {

PeriodicTask::PeriodicTask(Logger& logger, std::string name, std::chrono::milliseconds interval,
                           std::function<void()> tick)
    : logger_(logger), name_(std::move(name)), interval_(interval), tick_(std::move(tick)) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&PeriodicTask::run, this);
    logger_.info(name_, "task_started", {{"interval_ms", interval_.count()}});
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_.info(name_, "task_stopped");
}

void PeriodicTask::run() {
    while (running_.load()) {
        try {
            tick_();
        } catch (const std::exception& e) {
            logger_.error(name_, "task_tick_failed", {{"error", e.what()}});
        }

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }
}

} // namespace ledgerline
