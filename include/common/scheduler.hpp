#pragma once

#include <string>
#include <functional>
#include <mutex>
#include <map>
#include <atomic>
#include <thread>
#include <chrono>
#include <optional>
#include <vector>
#include <condition_variable>

#include "common/cron_expression.hpp"

class Scheduler {
public:
    using TaskCallback = std::function<void()>;
    using TimePoint = std::chrono::system_clock::time_point;

    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Schedule a task to run once at a specific time
    bool scheduleTask(const std::string& taskId,
                      TimePoint scheduledTime,
                      TaskCallback callback);

    // Schedule a task on a cron expression. Replaces any task with the same id.
    bool scheduleCronTask(const std::string& taskId,
                          const CronExpression& cron,
                          const CronTimezone& timezone,
                          TaskCallback callback);

    bool cancelTask(const std::string& taskId);
    void cancelAll();
    bool hasTask(const std::string& taskId) const;

    std::optional<TimePoint> getNextExecutionTime(const std::string& taskId) const;
    std::vector<std::pair<std::string, TimePoint>> getScheduledTasks() const;

    void start();
    void stop();
    bool isRunning() const { return running_; }

private:
    struct Task {
        TimePoint scheduledTime;
        std::optional<CronExpression> cron;
        CronTimezone timezone;
        TaskCallback callback;
    };

    void schedulerLoop();
    void executeTask(const std::string& taskId, const Task& task);

    std::map<std::string, Task> tasks_;
    mutable std::mutex tasksMutex_;
    std::condition_variable condition_;
    std::thread schedulerThread_;
    std::atomic<bool> running_;
};
