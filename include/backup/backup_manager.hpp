#pragma once

#include "backup/backup_catalog.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_job.hpp"
#include "backup/backup_metadata.hpp"
#include "backup/backup_scheduler.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/destination_handler.hpp"
#include "backup/job_event_channel.hpp"
#include "backup/metrics_sink.hpp"
#include "backup/storage_backend.hpp"
#include "common/parallel_task_manager.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Result of a start request. A queued request has no job yet; its ticket
// resolves to a job id once a slot frees up.
struct StartBackupResult {
    std::string ticket;
    std::optional<std::string> jobId;
    bool queued{false};
};

enum class TicketState {
    Queued,
    Dispatched,
    Rejected
};

struct TicketStatus {
    std::string ticket;
    std::string storageType;
    TicketState state{TicketState::Queued};
    std::optional<std::string> jobId;
    std::string error;
};

struct JobListFilters {
    std::optional<std::string> storageType;
    std::optional<BackupStatus> status;
    bool activeOnly{false};
};

class BackupManager {
public:
    // Settled tickets (dispatched or rejected) kept for resolveTicket lookups
    static constexpr size_t kSettledTicketLimit = 64;

    explicit BackupManager(BackupConfig config = createDefaultBackupConfig(),
                           MetricsSinkPtr metrics = nullptr);
    ~BackupManager();

    BackupManager(const BackupManager&) = delete;
    BackupManager& operator=(const BackupManager&) = delete;

    // Validates the config, loads persisted history and starts the cron
    // registry. Throws BackupError(InvalidConfig).
    void initialize();
    bool isInitialized() const;

    void registerBackend(StorageBackendPtr backend);
    void registerDestinationHandler(DestinationHandlerPtr handler);

    // Backup operations
    StartBackupResult startBackup(const std::string& storageType,
                                  const nlohmann::json& overrides = nlohmann::json::object());
    std::vector<StartBackupResult> startFullBackup();
    std::optional<std::string> resolveTicket(const std::string& ticket) const;
    std::optional<TicketStatus> getTicketStatus(const std::string& ticket) const;
    size_t trackedTicketCount() const;
    // Cancels a job by id, or drops a queued request by ticket
    bool cancelBackup(const std::string& id);

    std::optional<BackupJobSnapshot> getBackupStatus(const std::string& jobId) const;
    std::vector<BackupJobSnapshot> listJobs(const JobListFilters& filters = JobListFilters{}) const;
    std::vector<BackupMetadata> searchBackups(const BackupSearchFilters& filters = BackupSearchFilters{}) const;

    // Operations on finished backups. Throw BackupError(NotFound) for an unknown id.
    bool restoreBackup(const std::string& backupId, RestoreOptions options);
    bool deleteBackup(const std::string& backupId);
    bool verifyBackup(const std::string& backupId,
                      std::optional<VerificationType> type = std::nullopt);

    BackupStatistics getStatistics() const;

    BackupConfig getConfig() const;
    void updateConfig(const nlohmann::json& overrides);

    // Scheduling
    size_t scheduleBackups();
    void stopScheduledBackups();
    std::map<std::string, TimePoint> getNextScheduledBackups() const;
    void runScheduledBackups();

    // Applies the retention policy to completed backups of every storage
    // type and returns how many were deleted.
    size_t cleanupOldBackups();
    size_t cleanupOldBackups(TimePoint now);

    // Adds a finished backup record to the history.
    void importBackupMetadata(const BackupMetadata& metadata);

    JobEventSubscriptionPtr subscribe(size_t capacity = JobEventChannel::kDefaultCapacity);

    // Blocks until no job is active or queued. False on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout);
    // Blocks until the job is terminal and returns its final snapshot.
    std::optional<BackupJobSnapshot> waitForJob(const std::string& jobId,
                                                std::chrono::milliseconds timeout);

    // Stops schedules, cancels active jobs, drains the pool and releases backends
    void shutdown();

private:
    struct QueuedRequest {
        std::string ticket;
        std::string storageType;
        StorageBackupConfig config;
    };

    BackupJobPtr dispatchLocked(const std::string& storageType,
                                const StorageBackupConfig& config);
    BackupJobContext buildContextLocked(const StorageBackendPtr& backend) const;
    void processQueue();
    void onJobStateChanged(const std::weak_ptr<BackupJob>& weakJob, BackupStatus state);
    void onJobProgress(const std::weak_ptr<BackupJob>& weakJob);
    void onTaskFinished();
    void publish(JobEventType type, const BackupJobSnapshot& snapshot);

    void loadHistory();
    std::optional<BackupMetadata> findBackupLocked(const std::string& backupId) const;
    StorageBackendPtr findBackendLocked(const std::string& storageType) const;
    StorageBackupConfig resolveStorageConfig(const StorageBackupConfig& base,
                                             const nlohmann::json& overrides) const;
    void rebuildVerifierLocked();
    void settleTicketLocked(const std::string& ticket);

    void incrementCounter(const std::string& name, const MetricLabels& labels);
    void recordHistogram(const std::string& name, double value, const MetricLabels& labels);

    BackupConfig config_;
    MetricsSinkPtr metrics_;

    std::map<std::string, StorageBackendPtr> backends_;
    std::map<std::string, DestinationHandlerPtr> destinationHandlers_;

    std::map<std::string, BackupJobPtr> activeJobs_;
    std::map<std::string, BackupJobSnapshot> completedJobs_;
    std::deque<QueuedRequest> queue_;
    std::map<std::string, TicketStatus> tickets_;
    std::deque<std::string> settledTickets_;
    bool processingQueue_{false};
    size_t runningTasks_{0};
    bool initialized_{false};
    bool shuttingDown_{false};

    std::shared_ptr<BackupVerifier> verifier_;
    std::unique_ptr<BackupCatalog> catalog_;
    std::unique_ptr<ParallelTaskManager> pool_;
    std::unique_ptr<BackupScheduler> scheduler_;
    JobEventChannel events_;

    mutable std::mutex mutex_;
    std::condition_variable idleCondition_;
};
