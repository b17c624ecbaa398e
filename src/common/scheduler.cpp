#include "common/scheduler.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <sstream>

Scheduler::Scheduler()
    : running_(false) {
}

Scheduler::~Scheduler() {
    stop();
}

bool Scheduler::scheduleTask(const std::string& taskId,
                             TimePoint scheduledTime,
                             TaskCallback callback) {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    tasks_[taskId] = {scheduledTime, std::nullopt, CronTimezone::utc(), std::move(callback)};
    condition_.notify_one();
    return true;
}

bool Scheduler::scheduleCronTask(const std::string& taskId,
                                 const CronExpression& cron,
                                 const CronTimezone& timezone,
                                 TaskCallback callback) {
    auto next = cron.next(std::chrono::system_clock::now(), timezone);
    if (!next) {
        Logger::error("Cron expression never fires: " + cron.expression() + " (" + taskId + ")");
        return false;
    }

    std::unique_lock<std::mutex> lock(tasksMutex_);
    tasks_[taskId] = {*next, cron, timezone, std::move(callback)};
    Logger::debug("Scheduled " + taskId + " (" + cron.expression() + ") next at " +
                  utils::formatIsoTime(*next));
    condition_.notify_one();
    return true;
}

bool Scheduler::cancelTask(const std::string& taskId) {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    bool removed = tasks_.erase(taskId) > 0;
    condition_.notify_one();
    return removed;
}

void Scheduler::cancelAll() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    tasks_.clear();
    condition_.notify_one();
}

bool Scheduler::hasTask(const std::string& taskId) const {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    return tasks_.count(taskId) > 0;
}

std::optional<Scheduler::TimePoint> Scheduler::getNextExecutionTime(const std::string& taskId) const {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.scheduledTime;
}

std::vector<std::pair<std::string, Scheduler::TimePoint>> Scheduler::getScheduledTasks() const {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    std::vector<std::pair<std::string, TimePoint>> result;
    for (const auto& entry : tasks_) {
        result.emplace_back(entry.first, entry.second.scheduledTime);
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });
    return result;
}

void Scheduler::start() {
    if (!running_.exchange(true)) {
        schedulerThread_ = std::thread(&Scheduler::schedulerLoop, this);
    }
}

void Scheduler::stop() {
    {
        std::unique_lock<std::mutex> lock(tasksMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    condition_.notify_all();
    if (schedulerThread_.joinable() && schedulerThread_.get_id() != std::this_thread::get_id()) {
        schedulerThread_.join();
    } else if (schedulerThread_.joinable()) {
        schedulerThread_.detach();
    }
}

void Scheduler::executeTask(const std::string& taskId, const Task& task) {
    try {
        task.callback();
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Task " << taskId << " failed: " << e.what();
        Logger::error(ss.str());
    }
}

void Scheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(tasksMutex_);
    while (running_) {
        if (tasks_.empty()) {
            condition_.wait(lock, [this] {
                return !running_ || !tasks_.empty();
            });
            continue;
        }

        auto now = std::chrono::system_clock::now();
        auto nextTask = std::min_element(tasks_.begin(), tasks_.end(),
            [](const auto& a, const auto& b) {
                return a.second.scheduledTime < b.second.scheduledTime;
            });

        if (nextTask->second.scheduledTime <= now) {
            auto taskId = nextTask->first;
            auto task = nextTask->second;

            if (task.cron) {
                auto next = task.cron->next(now, task.timezone);
                if (next) {
                    nextTask->second.scheduledTime = *next;
                } else {
                    tasks_.erase(nextTask);
                }
            } else {
                tasks_.erase(nextTask);
            }

            lock.unlock();
            executeTask(taskId, task);
            lock.lock();
        } else {
            // Wake at least once a minute so wall-clock jumps are picked up
            auto wakeAt = std::min(nextTask->second.scheduledTime,
                                   now + std::chrono::minutes(1));
            condition_.wait_until(lock, wakeAt);
        }
    }
}
