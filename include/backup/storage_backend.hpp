#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backup/backup_config.hpp"
#include "backup/backup_metadata.hpp"
#include "common/cancellation_token.hpp"

// Contract every storage backend implements. One instance serves one
// storage type and may be called from several jobs concurrently.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual std::string storageType() const = 0;

    // Liveness probe. Never throws; failures are logged and reported as false.
    virtual bool isAvailable() = 0;

    // Descriptive information about the source. Contains "error" on failure.
    virtual nlohmann::json getStorageInfo() = 0;

    // Best-effort estimate in bytes, 0 when unknown.
    virtual uint64_t getEstimatedSize() = 0;

    // Writes artifacts into destinationDir only and returns their paths.
    // Re-invoking on the same directory replaces earlier output. Throws
    // BackupError on failure.
    virtual std::vector<std::string> createBackup(const StorageBackupConfig& config,
                                                  const std::string& destinationDir,
                                                  CancellationTokenPtr cancelToken) = 0;

    // Loads a backup into the source. Expected failures (bad artifacts, tool
    // errors) return false. With options.overwrite the existing data is
    // destroyed first.
    virtual bool restoreBackup(const BackupMetadata& metadata,
                               const RestoreOptions& options,
                               CancellationTokenPtr cancelToken) = 0;

    virtual bool verifyBackup(const BackupMetadata& metadata, VerificationType type) = 0;

    // Releases connections and other resources.
    virtual void cleanup() = 0;

    virtual std::string getLastError() const = 0;
};

using StorageBackendPtr = std::shared_ptr<StorageBackend>;
