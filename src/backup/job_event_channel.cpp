#include "backup/job_event_channel.hpp"
#include "common/utils.hpp"
#include <algorithm>

std::string toString(JobEventType type) {
    switch (type) {
        case JobEventType::Started: return "started";
        case JobEventType::Progress: return "progress";
        case JobEventType::Completed: return "completed";
        case JobEventType::Failed: return "failed";
        case JobEventType::Cancelled: return "cancelled";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const JobEvent& event) {
    j = nlohmann::json{
        {"type", toString(event.type)},
        {"timestamp", utils::formatIsoTime(event.timestamp)},
        {"job", event.job},
    };
}

JobEventSubscription::JobEventSubscription(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {
}

void JobEventSubscription::push(const JobEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
        }
        events_.push_back(event);
    }
    condition_.notify_one();
}

std::optional<JobEvent> JobEventSubscription::poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<JobEvent> JobEventSubscription::waitNext(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    JobEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<JobEvent> JobEventSubscription::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobEvent> out(std::make_move_iterator(events_.begin()),
                              std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

size_t JobEventSubscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t JobEventSubscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void JobEventSubscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

bool JobEventSubscription::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

JobEventSubscriptionPtr JobEventChannel::subscribe(size_t capacity) {
    auto subscription = std::make_shared<JobEventSubscription>(capacity);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(subscription);
    return subscription;
}

void JobEventChannel::publish(const JobEvent& event) {
    std::vector<JobEventSubscriptionPtr> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.begin();
        while (it != subscribers_.end()) {
            auto subscription = it->lock();
            if (!subscription || subscription->isClosed()) {
                it = subscribers_.erase(it);
            } else {
                live.push_back(std::move(subscription));
                ++it;
            }
        }
    }
    for (const auto& subscription : live) {
        subscription->push(event);
    }
}

size_t JobEventChannel::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& weak : subscribers_) {
        auto subscription = weak.lock();
        if (subscription && !subscription->isClosed()) {
            ++count;
        }
    }
    return count;
}
