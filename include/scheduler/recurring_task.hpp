#ifndef POSTSCHED_RECURRING_TASK_HPP
#define POSTSCHED_RECURRING_TASK_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace postsched {

// Runs a callback on its own worker thread every `interval`, so runs never
// overlap. trigger() wakes the worker early.
class RecurringTask {
public:
    RecurringTask(std::string name, std::chrono::milliseconds interval, std::function<void()> callback);
    ~RecurringTask();

    RecurringTask(const RecurringTask&) = delete;
    RecurringTask& operator=(const RecurringTask&) = delete;

    void start();
    void stop();
    void trigger();

    bool isRunning() const { return running_; }

private:
    void loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    std::function<void()> callback_;

    std::atomic<bool> running_{false};
    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool triggered_ = false;
};

} // namespace postsched

#endif // POSTSCHED_RECURRING_TASK_HPP
