#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "backup/backup_config.hpp"
#include "backup/backup_metadata.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/destination_handler.hpp"
#include "backup/storage_backend.hpp"
#include "common/job.hpp"

// Immutable copy of a job handed to callers and event subscribers.
struct BackupJobSnapshot {
    std::string id;
    std::string storageType;
    BackupStatus status{BackupStatus::Pending};
    int progress{0};
    std::string currentOperation;
    TimePoint startTime{};
    std::optional<TimePoint> endTime;
    std::optional<JobError> error;
    StorageBackupConfig config;
    BackupDestination destination;
    BackupMetadata metadata;
};

void to_json(nlohmann::json& j, const BackupJobSnapshot& s);

// Everything a job needs from the orchestrator to run.
struct BackupJobContext {
    StorageBackendPtr backend;
    std::vector<std::pair<BackupDestination, DestinationHandlerPtr>> destinations;
    std::shared_ptr<BackupVerifier> verifier;
    bool verify{true};
    std::vector<VerificationType> verificationTypes;
    std::string scratchRoot{"temp/backups"};
    int retries{0};
    std::chrono::milliseconds retryDelay{std::chrono::seconds(5)};
    std::chrono::minutes hookTimeout{60};
};

class BackupJob : public Job {
public:
    BackupJob(const std::string& storageType,
              const StorageBackupConfig& config,
              const BackupDestination& destination);

    // Runs every stage in order and always ends in a terminal state.
    // Never throws.
    void execute(const BackupJobContext& context);

    bool cancel() override;

    const std::string& getStorageType() const { return storageType_; }
    BackupJobSnapshot snapshot() const;
    BackupMetadata getMetadata() const;

protected:
    void onTerminalLocked(BackupStatus state) override;

private:
    void runStages(const BackupJobContext& context);
    std::vector<std::string> createWithRetries(const BackupJobContext& context,
                                               const std::string& scratchDir);
    void runHooks(const std::vector<std::string>& hooks, const std::string& stage,
                  const std::string& scratchDir, const BackupJobContext& context);
    void fail(const std::string& message, const std::string& code);

    const std::string storageType_;
    const StorageBackupConfig config_;
    const BackupDestination destination_;
    BackupMetadata metadata_;
    std::optional<JobError> jobError_;
};

using BackupJobPtr = std::shared_ptr<BackupJob>;
