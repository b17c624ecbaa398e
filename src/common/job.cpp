#include "common/job.hpp"
#include "common/utils.hpp"
#include "common/logger.hpp"
#include <algorithm>

Job::Job(const std::string& id)
    : id_(id)
    , startTime_(std::chrono::system_clock::now())
    , token_(std::make_shared<CancellationToken>()) {
}

bool Job::cancel() {
    if (!setState(BackupStatus::Cancelled)) {
        return false;
    }
    token_->cancel();
    return true;
}

bool Job::setState(BackupStatus state) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (::isTerminal(state_) || state == state_) {
            return false;
        }
        if (state == BackupStatus::Pending) {
            return false;
        }

        state_ = state;
        if (state == BackupStatus::Running) {
            startTime_ = std::chrono::system_clock::now();
        } else if (::isTerminal(state)) {
            endTime_ = std::chrono::system_clock::now();
            onTerminalLocked(state);
        }
        callback = stateCallback_;
    }

    Logger::debug("Job " + id_ + " -> " + toString(state));
    if (callback) {
        callback(state);
    }
    return true;
}

void Job::updateProgress(int progress, const std::string& operation) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (::isTerminal(state_)) {
            return;
        }
        progress_ = std::clamp(progress, 0, 100);
        currentOperation_ = operation;
        callback = progressCallback_;
    }
    if (callback) {
        callback(progress, operation);
    }
}

std::string Job::generateId(const std::string& prefix) {
    return utils::generateId(prefix);
}

BackupStatus Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int Job::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string Job::getCurrentOperation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentOperation_;
}

Job::TimePoint Job::getStartTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return startTime_;
}

std::optional<Job::TimePoint> Job::getEndTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endTime_;
}

void Job::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progressCallback_ = std::move(callback);
}

void Job::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    stateCallback_ = std::move(callback);
}
