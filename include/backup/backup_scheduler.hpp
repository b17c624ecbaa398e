#pragma once

#include "backup/backup_config.hpp"
#include "common/scheduler.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

// Cron registry for backups: one "backup-<type>" entry per enabled storage
// type plus a daily "cleanup" entry when auto-cleanup is on.
class BackupScheduler {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using BackupTrigger = std::function<void(const std::string& storageType)>;
    using CleanupTrigger = std::function<void()>;

    static constexpr const char* kCleanupTaskId = "cleanup";
    static constexpr const char* kCleanupCron = "0 3 * * *";

    BackupScheduler(BackupTrigger backupTrigger, CleanupTrigger cleanupTrigger);
    ~BackupScheduler();

    // Drops every existing entry and schedules from the config.
    // Returns the number of entries created.
    size_t scheduleAll(const BackupConfig& config);
    void stopAll();

    // task id -> next fire time
    std::map<std::string, TimePoint> getNextRunTimes() const;
    std::optional<TimePoint> getNextBackupTime() const;
    bool isRunning() const { return scheduler_.isRunning(); }

    static std::string backupTaskId(const std::string& storageType);

private:
    void runBackup(const std::string& storageType);
    void runCleanup();

    BackupTrigger backupTrigger_;
    CleanupTrigger cleanupTrigger_;
    Scheduler scheduler_;
    mutable std::mutex mutex_;
};
