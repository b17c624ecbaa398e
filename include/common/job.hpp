#pragma once

#include <string>
#include <memory>
#include <functional>
#include <mutex>
#include <chrono>
#include <optional>

#include "common/backup_status.hpp"
#include "common/cancellation_token.hpp"

// Callback type definitions
using ProgressCallback = std::function<void(int progress, const std::string& operation)>;
using StateCallback = std::function<void(BackupStatus state)>;

// Base for long-running work items. State only moves forward:
// Pending -> Running -> {Completed | Failed | Cancelled}, and a terminal
// state is entered at most once.
class Job {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    explicit Job(const std::string& id);
    virtual ~Job() = default;

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    // Marks the job cancelled and signals its token. False if already terminal.
    virtual bool cancel();

    bool isRunning() const { return getState() == BackupStatus::Running; }
    bool isCompleted() const { return getState() == BackupStatus::Completed; }
    bool isFailed() const { return getState() == BackupStatus::Failed; }
    bool isCancelled() const { return getState() == BackupStatus::Cancelled; }
    bool isTerminal() const { return ::isTerminal(getState()); }

    BackupStatus getState() const;
    int getProgress() const;
    std::string getCurrentOperation() const;
    const std::string& getId() const { return id_; }
    TimePoint getStartTime() const;
    std::optional<TimePoint> getEndTime() const;

    CancellationTokenPtr getCancellationToken() const { return token_; }

    // Callbacks run on the thread that changed the job, without the job lock held
    void setProgressCallback(ProgressCallback callback);
    void setStateCallback(StateCallback callback);

protected:
    bool setState(BackupStatus state);
    void updateProgress(int progress, const std::string& operation);
    // Called under the job lock when a terminal state is entered, before
    // the state callback runs
    virtual void onTerminalLocked(BackupStatus state) { (void)state; }

    static std::string generateId(const std::string& prefix);

    const std::string id_;
    BackupStatus state_{BackupStatus::Pending};
    int progress_{0};
    std::string currentOperation_{"Pending"};
    TimePoint startTime_;
    std::optional<TimePoint> endTime_;
    CancellationTokenPtr token_;
    ProgressCallback progressCallback_;
    StateCallback stateCallback_;
    mutable std::mutex mutex_;
};
