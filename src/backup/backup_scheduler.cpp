#include "backup/backup_scheduler.hpp"
#include "common/backup_error.hpp"
#include "common/cron_expression.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

BackupScheduler::BackupScheduler(BackupTrigger backupTrigger, CleanupTrigger cleanupTrigger)
    : backupTrigger_(std::move(backupTrigger))
    , cleanupTrigger_(std::move(cleanupTrigger)) {
}

BackupScheduler::~BackupScheduler() {
    stopAll();
}

std::string BackupScheduler::backupTaskId(const std::string& storageType) {
    return "backup-" + storageType;
}

size_t BackupScheduler::scheduleAll(const BackupConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_.cancelAll();

    if (!config.enabled || !config.defaultSchedule.enabled) {
        Logger::info("Scheduled backups are disabled");
        return 0;
    }

    auto timezone = CronTimezone::parse(config.defaultSchedule.timezone);
    if (!timezone) {
        throw BackupError(BackupErrorCode::InvalidConfig,
                          "Unsupported timezone: " + config.defaultSchedule.timezone);
    }

    size_t scheduled = 0;
    for (const auto& storage : config.storageConfigs) {
        if (!storage.enabled) {
            continue;
        }
        const std::string& expr = storage.scheduleCron.empty() ? config.defaultSchedule.cron
                                                               : storage.scheduleCron;
        std::string type = storage.type;
        if (scheduler_.scheduleCronTask(backupTaskId(type), CronExpression::parse(expr), *timezone,
                                        [this, type]() { runBackup(type); })) {
            ++scheduled;
            Logger::info("Scheduled backup for " + type + " with cron " + expr);
        }
    }

    if (config.retentionPolicy.autoCleanup) {
        if (scheduler_.scheduleCronTask(kCleanupTaskId, CronExpression::parse(kCleanupCron), *timezone,
                                        [this]() { runCleanup(); })) {
            ++scheduled;
            Logger::info("Scheduled backup cleanup with cron " + std::string(kCleanupCron));
        }
    }

    if (scheduled > 0) {
        scheduler_.start();
    }
    return scheduled;
}

void BackupScheduler::stopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    scheduler_.cancelAll();
    scheduler_.stop();
}

std::map<std::string, BackupScheduler::TimePoint> BackupScheduler::getNextRunTimes() const {
    std::map<std::string, TimePoint> result;
    for (const auto& task : scheduler_.getScheduledTasks()) {
        result[task.first] = task.second;
    }
    return result;
}

std::optional<BackupScheduler::TimePoint> BackupScheduler::getNextBackupTime() const {
    for (const auto& task : scheduler_.getScheduledTasks()) {
        if (task.first != kCleanupTaskId) {
            return task.second;
        }
    }
    return std::nullopt;
}

void BackupScheduler::runBackup(const std::string& storageType) {
    Logger::info("Running scheduled backup for " + storageType);
    try {
        backupTrigger_(storageType);
    } catch (const std::exception& e) {
        Logger::error("Scheduled backup failed for " + storageType + ": " + e.what());
    }
}

void BackupScheduler::runCleanup() {
    Logger::info("Running scheduled backup cleanup");
    try {
        cleanupTrigger_();
    } catch (const std::exception& e) {
        Logger::error(std::string("Scheduled cleanup failed: ") + e.what());
    }
}
