#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "backup/backup_job.hpp"

enum class JobEventType {
    Started,
    Progress,
    Completed,
    Failed,
    Cancelled
};

std::string toString(JobEventType type);

struct JobEvent {
    JobEventType type{JobEventType::Started};
    BackupJobSnapshot job;
    std::chrono::system_clock::time_point timestamp{};
};

void to_json(nlohmann::json& j, const JobEvent& event);

// One subscriber's bounded mailbox. When full the oldest event is dropped.
class JobEventSubscription {
public:
    explicit JobEventSubscription(size_t capacity);

    JobEventSubscription(const JobEventSubscription&) = delete;
    JobEventSubscription& operator=(const JobEventSubscription&) = delete;

    std::optional<JobEvent> poll();
    std::optional<JobEvent> waitNext(std::chrono::milliseconds timeout);
    std::vector<JobEvent> drain();

    size_t droppedCount() const;
    size_t pending() const;

    // Wakes waiters; later publishes are ignored.
    void close();
    bool isClosed() const;

private:
    friend class JobEventChannel;
    void push(const JobEvent& event);

    const size_t capacity_;
    std::deque<JobEvent> events_;
    size_t dropped_{0};
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

using JobEventSubscriptionPtr = std::shared_ptr<JobEventSubscription>;

// Fan-out of job lifecycle events. The channel only holds weak references,
// so a subscriber goes away by dropping its subscription.
class JobEventChannel {
public:
    static constexpr size_t kDefaultCapacity = 256;

    JobEventSubscriptionPtr subscribe(size_t capacity = kDefaultCapacity);
    void publish(const JobEvent& event);
    size_t subscriberCount() const;

private:
    std::vector<std::weak_ptr<JobEventSubscription>> subscribers_;
    mutable std::mutex mutex_;
};
