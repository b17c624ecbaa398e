#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "backup/storage_backend.hpp"
#include "common/process_runner.hpp"

// Shared behavior for backends that produce files: gzip compression of the
// produced artifacts, decompression before restore, checksum-based default
// verification and tool invocation helpers.
class BaseStorageBackend : public StorageBackend {
public:
    explicit BaseStorageBackend(std::string storageType);

    std::string storageType() const override { return storageType_; }

    std::vector<std::string> createBackup(const StorageBackupConfig& config,
                                          const std::string& destinationDir,
                                          CancellationTokenPtr cancelToken) override;

    bool restoreBackup(const BackupMetadata& metadata,
                       const RestoreOptions& options,
                       CancellationTokenPtr cancelToken) override;

    bool verifyBackup(const BackupMetadata& metadata, VerificationType type) override;

    void cleanup() override {}

    std::string getLastError() const override;

    // gzip helpers; the source file is left in place
    static bool compressFile(const std::string& source, const std::string& target, int level = 6);
    static bool decompressFile(const std::string& source, const std::string& target);

    static std::map<std::string, std::string> calculateChecksums(const std::vector<std::string>& files);

protected:
    // Produce raw artifacts in destinationDir.
    virtual std::vector<std::string> doCreateBackup(const StorageBackupConfig& config,
                                                    const std::string& destinationDir,
                                                    CancellationTokenPtr cancelToken) = 0;

    // Load already-decompressed artifacts.
    virtual bool doRestoreBackup(const BackupMetadata& metadata,
                                 const std::vector<std::string>& files,
                                 const RestoreOptions& options,
                                 CancellationTokenPtr cancelToken) = 0;

    bool verifyChecksums(const BackupMetadata& metadata);
    bool verifyFilesPresent(const BackupMetadata& metadata);

    ProcessResult runCommand(const std::string& program,
                             const std::vector<std::string>& args,
                             const ProcessOptions& options);

    void setLastError(const std::string& error);

    std::string storageType_;
    std::string lastError_;
    mutable std::mutex errorMutex_;
};
