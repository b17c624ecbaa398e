#include "backup/backup_manager.hpp"
#include "backup/retention_policy.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Upper bound accepted for maxParallelJobs
constexpr size_t kWorkerThreads = 10;

MetricLabels labelsFor(const std::string& storageType) {
    return MetricLabels{{"storageType", storageType}};
}

} // namespace

BackupManager::BackupManager(BackupConfig config, MetricsSinkPtr metrics)
    : config_(std::move(config))
    , metrics_(std::move(metrics))
    , catalog_(std::make_unique<BackupCatalog>(config_.global.catalogDirectory))
    , pool_(std::make_unique<ParallelTaskManager>(kWorkerThreads)) {
    destinationHandlers_["local"] = std::make_shared<LocalDestinationHandler>();
    rebuildVerifierLocked();
    scheduler_ = std::make_unique<BackupScheduler>(
        [this](const std::string& storageType) { startBackup(storageType); },
        [this]() { cleanupOldBackups(); });
}

BackupManager::~BackupManager() {
    shutdown();
}

void BackupManager::initialize() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            return;
        }
        Logger::info("Initializing backup manager...");
        validateBackupConfig(config_);
    }

    loadHistory();

    bool enabled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        initialized_ = true;
        enabled = config_.enabled;
    }

    if (enabled) {
        scheduleBackups();
    }
    processQueue();
    Logger::info("Backup manager initialized successfully");
}

bool BackupManager::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void BackupManager::registerBackend(StorageBackendPtr backend) {
    if (!backend) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    backends_[backend->storageType()] = backend;
    Logger::info("Registered storage backend: " + backend->storageType());
}

void BackupManager::registerDestinationHandler(DestinationHandlerPtr handler) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    destinationHandlers_[handler->type()] = handler;
    Logger::info("Registered destination handler: " + handler->type());
}

StartBackupResult BackupManager::startBackup(const std::string& storageType, const json& overrides) {
    StorageBackupConfig storageConfig;
    StorageBackendPtr backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            throw BackupError(BackupErrorCode::ShuttingDown, "Backup manager is shutting down");
        }
        if (!initialized_) {
            throw BackupError(BackupErrorCode::NotConfigured, "Backup manager not initialized");
        }
        if (!config_.enabled) {
            throw BackupError(BackupErrorCode::NotEnabled, "Backup system is disabled");
        }
        const StorageBackupConfig* found = config_.findStorageConfig(storageType);
        if (!found || !found->enabled) {
            throw BackupError(BackupErrorCode::NotEnabled,
                              "Backup not enabled for storage type: " + storageType);
        }
        if (config_.destinations.empty()) {
            throw BackupError(BackupErrorCode::NotConfigured, "No backup destination configured");
        }
        backend = findBackendLocked(storageType);
        if (!backend) {
            throw BackupError(BackupErrorCode::NoHandler,
                              "No backup handler available for storage type: " + storageType);
        }
        storageConfig = *found;
    }

    storageConfig = resolveStorageConfig(storageConfig, overrides);

    // Probe outside the lock, it may hit the network
    if (!backend->isAvailable()) {
        throw BackupError(BackupErrorCode::Unavailable,
                          "Storage " + storageType + " is not available: " + backend->getLastError());
    }

    StartBackupResult result;
    result.ticket = utils::generateId("ticket");
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            throw BackupError(BackupErrorCode::ShuttingDown, "Backup manager is shutting down");
        }

        TicketStatus ticket;
        ticket.ticket = result.ticket;
        ticket.storageType = storageType;

        const size_t ceiling = static_cast<size_t>(config_.global.maxParallelJobs);
        if (activeJobs_.size() >= ceiling || !queue_.empty()) {
            queue_.push_back(QueuedRequest{result.ticket, storageType, storageConfig});
            tickets_[result.ticket] = ticket;
            result.queued = true;
            Logger::info("Backup for " + storageType + " queued as " + result.ticket + " (" +
                         std::to_string(queue_.size()) + " waiting)");
        } else {
            BackupJobPtr job = dispatchLocked(storageType, storageConfig);
            ticket.state = TicketState::Dispatched;
            ticket.jobId = job->getId();
            tickets_[result.ticket] = ticket;
            settleTicketLocked(result.ticket);
            result.jobId = job->getId();
        }
    }

    if (result.queued) {
        processQueue();
    }
    return result;
}

std::vector<StartBackupResult> BackupManager::startFullBackup() {
    std::vector<std::string> types;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& storage : config_.storageConfigs) {
            if (storage.enabled) {
                types.push_back(storage.type);
            }
        }
    }

    Logger::info("Starting full backup of " + std::to_string(types.size()) + " storage type(s)");
    std::vector<StartBackupResult> results;
    for (const auto& type : types) {
        try {
            results.push_back(startBackup(type));
        } catch (const std::exception& e) {
            Logger::error("Failed to start backup for " + type + ": " + e.what());
        }
    }
    return results;
}

std::optional<std::string> BackupManager::resolveTicket(const std::string& ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(ticket);
    if (it == tickets_.end()) {
        return std::nullopt;
    }
    return it->second.jobId;
}

std::optional<TicketStatus> BackupManager::getTicketStatus(const std::string& ticket) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tickets_.find(ticket);
    if (it == tickets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t BackupManager::trackedTicketCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tickets_.size();
}

void BackupManager::settleTicketLocked(const std::string& ticket) {
    settledTickets_.push_back(ticket);
    while (settledTickets_.size() > kSettledTicketLimit) {
        tickets_.erase(settledTickets_.front());
        settledTickets_.pop_front();
    }
}

bool BackupManager::cancelBackup(const std::string& id) {
    BackupJobPtr job;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto active = activeJobs_.find(id);
        if (active != activeJobs_.end()) {
            job = active->second;
        } else {
            auto queued = std::find_if(queue_.begin(), queue_.end(),
                                       [&id](const QueuedRequest& r) { return r.ticket == id; });
            if (queued == queue_.end()) {
                Logger::warning("Cannot cancel " + id + ": no active job or queued request");
                return false;
            }
            queue_.erase(queued);
            tickets_[id].state = TicketState::Rejected;
            tickets_[id].error = "Cancelled before dispatch";
            settleTicketLocked(id);
            Logger::info("Queued backup request " + id + " cancelled");
            idleCondition_.notify_all();
            return true;
        }
    }

    // The state callback moves the job to history and notifies subscribers
    return job->cancel();
}

std::optional<BackupJobSnapshot> BackupManager::getBackupStatus(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto active = activeJobs_.find(jobId);
    if (active != activeJobs_.end()) {
        return active->second->snapshot();
    }
    auto done = completedJobs_.find(jobId);
    if (done != completedJobs_.end()) {
        return done->second;
    }
    return std::nullopt;
}

std::vector<BackupJobSnapshot> BackupManager::listJobs(const JobListFilters& filters) const {
    std::vector<BackupJobSnapshot> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : activeJobs_) {
            jobs.push_back(entry.second->snapshot());
        }
        if (!filters.activeOnly) {
            for (const auto& entry : completedJobs_) {
                jobs.push_back(entry.second);
            }
        }
    }

    jobs.erase(std::remove_if(jobs.begin(), jobs.end(),
                              [&filters](const BackupJobSnapshot& s) {
                                  return (filters.storageType && s.storageType != *filters.storageType) ||
                                         (filters.status && s.status != *filters.status);
                              }),
               jobs.end());
    std::sort(jobs.begin(), jobs.end(),
              [](const BackupJobSnapshot& a, const BackupJobSnapshot& b) {
                  return a.startTime > b.startTime;
              });
    return jobs;
}

std::vector<BackupMetadata> BackupManager::searchBackups(const BackupSearchFilters& filters) const {
    std::vector<BackupMetadata> results;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : completedJobs_) {
            if (entry.second.status == BackupStatus::Completed &&
                matchesFilters(entry.second.metadata, filters)) {
                results.push_back(entry.second.metadata);
            }
        }
    }

    auto less = [&filters](const BackupMetadata& a, const BackupMetadata& b) {
        switch (filters.sortBy) {
            case BackupSortField::Size: return a.size < b.size;
            case BackupSortField::StorageType: return a.storageType < b.storageType;
            case BackupSortField::StartTime: break;
        }
        return a.startTime < b.startTime;
    };
    std::stable_sort(results.begin(), results.end(),
                     [&](const BackupMetadata& a, const BackupMetadata& b) {
                         return filters.descending ? less(b, a) : less(a, b);
                     });

    if (filters.offset >= results.size()) {
        return {};
    }
    auto first = results.begin() + static_cast<std::ptrdiff_t>(filters.offset);
    auto last = results.end();
    if (static_cast<size_t>(last - first) > filters.limit) {
        last = first + static_cast<std::ptrdiff_t>(filters.limit);
    }
    return std::vector<BackupMetadata>(first, last);
}

bool BackupManager::restoreBackup(const std::string& backupId, RestoreOptions options) {
    BackupMetadata metadata;
    StorageBackendPtr backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = findBackupLocked(backupId);
        if (!found || found->status != BackupStatus::Completed) {
            throw BackupError(BackupErrorCode::NotFound, "Backup not found: " + backupId);
        }
        metadata = *found;
        backend = findBackendLocked(metadata.storageType);
        if (!backend) {
            throw BackupError(BackupErrorCode::NoHandler,
                              "No restore handler available for storage type: " + metadata.storageType);
        }
    }

    options.backupId = backupId;
    Logger::info("Restoring backup " + backupId + (options.overwrite ? " (overwrite)" : ""));

    bool restored = false;
    try {
        restored = backend->restoreBackup(metadata, options, std::make_shared<CancellationToken>());
    } catch (const std::exception& e) {
        incrementCounter("backup_restore_error", labelsFor(metadata.storageType));
        Logger::error("Restore of " + backupId + " failed: " + e.what());
        throw;
    }

    if (restored) {
        incrementCounter("backup_restore_success", labelsFor(metadata.storageType));
        Logger::info("Successfully restored backup " + backupId);
    } else {
        incrementCounter("backup_restore_failure", labelsFor(metadata.storageType));
        Logger::error("Restore of " + backupId + " failed: " + backend->getLastError());
    }
    return restored;
}

bool BackupManager::deleteBackup(const std::string& backupId) {
    Logger::info("Deleting backup " + backupId);

    BackupMetadata metadata;
    std::vector<std::pair<BackupDestination, DestinationHandlerPtr>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = findBackupLocked(backupId);
        if (!found) {
            throw BackupError(BackupErrorCode::NotFound, "Backup not found: " + backupId);
        }
        metadata = *found;
        for (const auto& destination : config_.destinations) {
            auto handler = destinationHandlers_.find(destination.type);
            targets.emplace_back(destination,
                                 handler != destinationHandlers_.end() ? handler->second : nullptr);
        }
    }

    for (const auto& target : targets) {
        if (!target.second) {
            Logger::warning("No handler for destination type " + target.first.type +
                            ", skipping delete of " + backupId);
            continue;
        }
        if (!target.second->remove(metadata, target.first)) {
            throw BackupError(BackupErrorCode::Internal,
                              "Failed to delete backup " + backupId + " from " + target.first.path);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        completedJobs_.erase(backupId);
    }
    catalog_->remove(backupId);

    Logger::info("Successfully deleted backup " + backupId);
    return true;
}

bool BackupManager::verifyBackup(const std::string& backupId, std::optional<VerificationType> type) {
    BackupMetadata metadata;
    StorageBackendPtr backend;
    std::shared_ptr<BackupVerifier> verifier;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = findBackupLocked(backupId);
        if (!found || found->status != BackupStatus::Completed) {
            throw BackupError(BackupErrorCode::NotFound, "Backup not found: " + backupId);
        }
        metadata = *found;
        backend = findBackendLocked(metadata.storageType);
        if (!backend) {
            throw BackupError(BackupErrorCode::NoHandler,
                              "No verification handler available for storage type: " + metadata.storageType);
        }
        verifier = verifier_;
    }

    VerificationResult result = verifier->verifyBackup(metadata, type.value_or(VerificationType::Checksum), backend);
    for (const auto& error : result.errors) {
        Logger::error("Verification of " + backupId + ": " + error);
    }
    for (const auto& warning : result.warnings) {
        Logger::warning("Verification of " + backupId + ": " + warning);
    }
    return result.passed;
}

BackupStatistics BackupManager::getStatistics() const {
    BackupStatistics stats;
    std::vector<BackupJobSnapshot> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : activeJobs_) {
            all.push_back(entry.second->snapshot());
        }
        for (const auto& entry : completedJobs_) {
            all.push_back(entry.second);
        }
        stats.activeBackups = activeJobs_.size();
        stats.queuedBackups = queue_.size();
    }

    stats.totalBackups = all.size();
    for (const auto& job : all) {
        switch (job.status) {
            case BackupStatus::Completed: {
                ++stats.successfulBackups;
                stats.totalSize += job.metadata.size;
                if (!stats.lastBackupTime || job.startTime > *stats.lastBackupTime) {
                    stats.lastBackupTime = job.startTime;
                }
                auto& typeStats = stats.storageTypeStats[job.storageType];
                ++typeStats.count;
                typeStats.totalSize += job.metadata.size;
                if (!typeStats.lastBackup || job.startTime > *typeStats.lastBackup) {
                    typeStats.lastBackup = job.startTime;
                }
                break;
            }
            case BackupStatus::Failed:
                ++stats.failedBackups;
                break;
            case BackupStatus::Cancelled:
                ++stats.cancelledBackups;
                break;
            default:
                break;
        }
    }

    if (stats.successfulBackups > 0) {
        stats.averageSize = stats.totalSize / stats.successfulBackups;
    }
    if (stats.totalBackups > 0) {
        stats.successRate = static_cast<double>(stats.successfulBackups) / stats.totalBackups * 100.0;
    }
    stats.nextScheduledBackup = scheduler_->getNextBackupTime();
    return stats;
}

BackupConfig BackupManager::getConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void BackupManager::updateConfig(const json& overrides) {
    bool reschedule;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        BackupConfig merged = mergeBackupConfig(config_, overrides);
        validateBackupConfig(merged);
        config_ = merged;
        rebuildVerifierLocked();
        reschedule = initialized_;
    }

    if (reschedule) {
        stopScheduledBackups();
        scheduleBackups();
    }
    Logger::info("Backup configuration updated");
    processQueue();
}

size_t BackupManager::scheduleBackups() {
    BackupConfig config = getConfig();
    Logger::info("Scheduling automatic backups");
    return scheduler_->scheduleAll(config);
}

void BackupManager::stopScheduledBackups() {
    Logger::info("Stopping scheduled backups");
    scheduler_->stopAll();
}

std::map<std::string, TimePoint> BackupManager::getNextScheduledBackups() const {
    std::map<std::string, TimePoint> next;
    const std::string prefix = BackupScheduler::backupTaskId("");
    for (const auto& entry : scheduler_->getNextRunTimes()) {
        if (entry.first.compare(0, prefix.size(), prefix) == 0) {
            next[entry.first.substr(prefix.size())] = entry.second;
        }
    }
    return next;
}

void BackupManager::runScheduledBackups() {
    Logger::info("Running scheduled backups immediately");
    startFullBackup();
}

size_t BackupManager::cleanupOldBackups() {
    return cleanupOldBackups(utils::now());
}

size_t BackupManager::cleanupOldBackups(TimePoint now) {
    Logger::info("Starting cleanup of old backups");

    std::map<std::string, std::vector<BackupMetadata>> byType;
    RetentionPolicy policy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        policy = config_.retentionPolicy;
        for (const auto& entry : completedJobs_) {
            if (entry.second.status == BackupStatus::Completed) {
                byType[entry.second.storageType].push_back(entry.second.metadata);
            }
        }
    }

    size_t deleted = 0;
    for (auto& entry : byType) {
        RetentionDecision decision = computeRetention(std::move(entry.second), policy, now);
        Logger::debug("Retention for " + entry.first + ": keeping " + std::to_string(decision.keep.size()) +
                      ", removing " + std::to_string(decision.remove.size()));
        for (const auto& id : decision.remove) {
            try {
                if (deleteBackup(id)) {
                    ++deleted;
                }
            } catch (const std::exception& e) {
                Logger::error("Failed to delete backup " + id + ": " + e.what());
            }
        }
    }

    Logger::info("Cleanup completed. Deleted " + std::to_string(deleted) + " old backups");
    return deleted;
}

void BackupManager::importBackupMetadata(const BackupMetadata& metadata) {
    BackupJobSnapshot snapshot;
    snapshot.id = metadata.id;
    snapshot.storageType = metadata.storageType;
    snapshot.status = metadata.status;
    snapshot.progress = metadata.status == BackupStatus::Completed ? 100 : 0;
    snapshot.currentOperation = toString(metadata.status);
    snapshot.startTime = metadata.startTime;
    snapshot.endTime = metadata.endTime;
    snapshot.error = metadata.error;
    snapshot.config.type = metadata.storageType;
    snapshot.config.backupType = metadata.backupType;
    snapshot.config.compression = metadata.compression;
    snapshot.destination.type = metadata.destination.type;
    snapshot.destination.path = metadata.destination.path;
    snapshot.metadata = metadata;

    std::lock_guard<std::mutex> lock(mutex_);
    if (activeJobs_.count(metadata.id)) {
        return;
    }
    completedJobs_[metadata.id] = snapshot;
}

JobEventSubscriptionPtr BackupManager::subscribe(size_t capacity) {
    return events_.subscribe(capacity);
}

bool BackupManager::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCondition_.wait_for(lock, timeout, [this] {
        return activeJobs_.empty() && queue_.empty() && runningTasks_ == 0 && !processingQueue_;
    });
}

std::optional<BackupJobSnapshot> BackupManager::waitForJob(const std::string& jobId,
                                                           std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool done = idleCondition_.wait_for(lock, timeout, [this, &jobId] {
        return activeJobs_.count(jobId) == 0;
    });
    if (!done) {
        return std::nullopt;
    }
    auto it = completedJobs_.find(jobId);
    if (it == completedJobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void BackupManager::shutdown() {
    std::vector<BackupJobPtr> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            return;
        }
        shuttingDown_ = true;
        Logger::info("Shutting down backup manager");
        for (const auto& entry : activeJobs_) {
            jobs.push_back(entry.second);
        }
        for (const auto& request : queue_) {
            tickets_[request.ticket].state = TicketState::Rejected;
            tickets_[request.ticket].error = "Backup manager is shutting down";
            settleTicketLocked(request.ticket);
        }
        queue_.clear();
    }

    scheduler_->stopAll();
    for (const auto& job : jobs) {
        job->cancel();
    }
    pool_->shutdown();

    std::map<std::string, StorageBackendPtr> backends;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backends.swap(backends_);
    }
    for (const auto& entry : backends) {
        try {
            entry.second->cleanup();
        } catch (const std::exception& e) {
            Logger::error("Error cleaning up storage handler " + entry.first + ": " + e.what());
        }
    }

    idleCondition_.notify_all();
    Logger::info("Backup manager shutdown complete");
}

BackupJobPtr BackupManager::dispatchLocked(const std::string& storageType,
                                           const StorageBackupConfig& config) {
    StorageBackendPtr backend = findBackendLocked(storageType);
    if (!backend) {
        throw BackupError(BackupErrorCode::NoHandler,
                          "No backup handler available for storage type: " + storageType);
    }

    auto job = std::make_shared<BackupJob>(storageType, config, config_.destinations.front());
    std::weak_ptr<BackupJob> weakJob = job;
    job->setStateCallback([this, weakJob](BackupStatus state) { onJobStateChanged(weakJob, state); });
    job->setProgressCallback([this, weakJob](int, const std::string&) { onJobProgress(weakJob); });

    activeJobs_[job->getId()] = job;
    ++runningTasks_;

    BackupJobContext context = buildContextLocked(backend);
    pool_->addTask([this, job, context]() {
        job->execute(context);
        onTaskFinished();
    });

    Logger::info("Started backup job " + job->getId() + " for " + storageType);
    return job;
}

BackupJobContext BackupManager::buildContextLocked(const StorageBackendPtr& backend) const {
    BackupJobContext context;
    context.backend = backend;
    for (const auto& destination : config_.destinations) {
        auto handler = destinationHandlers_.find(destination.type);
        context.destinations.emplace_back(destination,
                                          handler != destinationHandlers_.end() ? handler->second : nullptr);
    }
    context.verifier = verifier_;
    context.verify = config_.global.enableVerification;
    context.verificationTypes = config_.global.verificationTypes;
    context.scratchRoot = (fs::path(config_.global.scratchDirectory) / "backups").string();
    context.retries = config_.defaultSchedule.retries;
    context.hookTimeout = std::chrono::minutes(config_.defaultSchedule.timeoutMinutes);
    return context;
}

void BackupManager::processQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (processingQueue_ || !initialized_) {
            return;
        }
        processingQueue_ = true;

        const size_t ceiling = static_cast<size_t>(config_.global.maxParallelJobs);
        while (!shuttingDown_ && !queue_.empty() && activeJobs_.size() < ceiling) {
            QueuedRequest request = queue_.front();
            queue_.pop_front();
            TicketStatus& ticket = tickets_[request.ticket];
            try {
                BackupJobPtr job = dispatchLocked(request.storageType, request.config);
                ticket.state = TicketState::Dispatched;
                ticket.jobId = job->getId();
                Logger::info("Queued request " + request.ticket + " dispatched as " + job->getId());
            } catch (const std::exception& e) {
                ticket.state = TicketState::Rejected;
                ticket.error = e.what();
                Logger::error("Failed to dispatch queued backup " + request.ticket + ": " + e.what());
            }
            settleTicketLocked(request.ticket);
        }

        processingQueue_ = false;
    }
    idleCondition_.notify_all();
}

void BackupManager::onJobStateChanged(const std::weak_ptr<BackupJob>& weakJob, BackupStatus state) {
    BackupJobPtr job = weakJob.lock();
    if (!job) {
        return;
    }
    BackupJobSnapshot snapshot = job->snapshot();
    const MetricLabels labels = labelsFor(snapshot.storageType);

    if (state == BackupStatus::Running) {
        incrementCounter("backup_job_started", labels);
        publish(JobEventType::Started, snapshot);
        return;
    }
    if (!::isTerminal(state)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeJobs_.erase(snapshot.id);
        completedJobs_[snapshot.id] = snapshot;
    }
    if (!catalog_->save(snapshot.metadata)) {
        Logger::warning("Failed to persist catalog record for " + snapshot.id);
    }

    switch (state) {
        case BackupStatus::Completed: {
            incrementCounter("backup_job_completed", labels);
            auto end = snapshot.endTime.value_or(utils::now());
            double seconds = std::chrono::duration<double>(end - snapshot.startTime).count();
            recordHistogram("backup_job_duration", seconds, labels);
            recordHistogram("backup_size", static_cast<double>(snapshot.metadata.size), labels);
            publish(JobEventType::Completed, snapshot);
            break;
        }
        case BackupStatus::Failed:
            incrementCounter("backup_job_failed", labels);
            publish(JobEventType::Failed, snapshot);
            break;
        case BackupStatus::Cancelled:
            incrementCounter("backup_job_cancelled", labels);
            publish(JobEventType::Cancelled, snapshot);
            break;
        default:
            break;
    }

    idleCondition_.notify_all();
    processQueue();
}

void BackupManager::onJobProgress(const std::weak_ptr<BackupJob>& weakJob) {
    BackupJobPtr job = weakJob.lock();
    if (job) {
        publish(JobEventType::Progress, job->snapshot());
    }
}

void BackupManager::onTaskFinished() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (runningTasks_ > 0) {
            --runningTasks_;
        }
    }
    idleCondition_.notify_all();
    processQueue();
}

void BackupManager::publish(JobEventType type, const BackupJobSnapshot& snapshot) {
    JobEvent event;
    event.type = type;
    event.job = snapshot;
    event.timestamp = utils::now();
    events_.publish(event);
}

void BackupManager::loadHistory() {
    std::vector<BackupMetadata> records = catalog_->loadAll();

    std::vector<BackupDestination> destinations = getConfig().destinations;
    for (const auto& destination : destinations) {
        if (destination.type != "local") {
            continue;
        }
        std::error_code ec;
        if (!fs::is_directory(destination.path, ec)) {
            continue;
        }
        for (auto it = fs::recursive_directory_iterator(destination.path, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it.depth() > 2) {
                it.disable_recursion_pending();
                continue;
            }
            std::error_code entryEc;
            if (!it->is_regular_file(entryEc) || it->path().filename() != "metadata.json") {
                continue;
            }
            try {
                std::ifstream in(it->path());
                records.push_back(json::parse(in).get<BackupMetadata>());
            } catch (const std::exception& e) {
                Logger::warning("Skipping unreadable metadata " + it->path().string() + ": " + e.what());
            }
        }
    }

    size_t loaded = 0;
    for (const auto& record : records) {
        bool known;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            known = completedJobs_.count(record.id) > 0;
        }
        if (!known) {
            importBackupMetadata(record);
            ++loaded;
        }
    }
    Logger::info("Loaded " + std::to_string(loaded) + " backup record(s) from history");
}

std::optional<BackupMetadata> BackupManager::findBackupLocked(const std::string& backupId) const {
    auto it = completedJobs_.find(backupId);
    if (it == completedJobs_.end()) {
        return std::nullopt;
    }
    BackupMetadata metadata = it->second.metadata;
    metadata.status = it->second.status;
    return metadata;
}

StorageBackendPtr BackupManager::findBackendLocked(const std::string& storageType) const {
    auto it = backends_.find(storageType);
    return it != backends_.end() ? it->second : nullptr;
}

StorageBackupConfig BackupManager::resolveStorageConfig(const StorageBackupConfig& base,
                                                        const json& overrides) const {
    if (overrides.is_null() || overrides.empty()) {
        return base;
    }
    if (!overrides.is_object()) {
        throw BackupError(BackupErrorCode::InvalidConfig, "Backup options must be a JSON object");
    }
    try {
        json merged = base;
        merged.merge_patch(overrides);
        merged["type"] = base.type;
        return merged.get<StorageBackupConfig>();
    } catch (const json::exception& e) {
        throw BackupError(BackupErrorCode::InvalidConfig,
                          "Invalid backup options for " + base.type + ": " + e.what());
    }
}

void BackupManager::rebuildVerifierLocked() {
    VerificationConfig verification;
    verification.maxParallelJobs = config_.global.maxParallelJobs;
    verification.timeoutSeconds = config_.global.verificationTimeoutSeconds;
    verification.enableParallelChecks = config_.global.parallelVerification;
    verification.customScripts = config_.global.customVerificationScripts;
    verification.scratchDirectory = config_.global.scratchDirectory;
    verification.reportDirectory = config_.global.reportDirectory;
    verifier_ = std::make_shared<BackupVerifier>(verification);
}

void BackupManager::incrementCounter(const std::string& name, const MetricLabels& labels) {
    if (!metrics_) {
        return;
    }
    try {
        metrics_->incrementCounter(name, labels);
    } catch (const std::exception& e) {
        Logger::warning("Metrics sink failed on " + name + ": " + e.what());
    }
}

void BackupManager::recordHistogram(const std::string& name, double value, const MetricLabels& labels) {
    if (!metrics_) {
        return;
    }
    try {
        metrics_->recordHistogram(name, value, labels);
    } catch (const std::exception& e) {
        Logger::warning("Metrics sink failed on " + name + ": " + e.what());
    }
}
