#include "../../include/scheduler/recurring_task.hpp"
#include "../../include/utils/logger.hpp"

namespace postsched {

RecurringTask::RecurringTask(std::string name, std::chrono::milliseconds interval, std::function<void()> callback)
    : name_(std::move(name)), interval_(interval), callback_(std::move(callback)) {
}

RecurringTask::~RecurringTask() {
    stop();
}

void RecurringTask::start() {
    if (running_.exchange(true)) return;
    worker_ = std::thread([this]() { loop(); });
}

void RecurringTask::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void RecurringTask::trigger() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        triggered_ = true;
    }
    wake_.notify_all();
}

void RecurringTask::loop() {
    Logger::getInstance().info(name_ + " started");

    while (running_) {
        try {
            callback_();
        } catch (const std::exception& e) {
            Logger::getInstance().warning(name_ + " loop error: " + e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, interval_, [this]() { return triggered_ || !running_; });
        triggered_ = false;
    }

    Logger::getInstance().info(name_ + " stopped");
}

} // namespace postsched
