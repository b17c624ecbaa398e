#pragma once

#include <memory>
#include <string>
#include <vector>

#include "backup/backup_config.hpp"
#include "backup/backup_metadata.hpp"

// Moves artifacts to a configured destination. Remote destinations (S3,
// Azure, GCP, FTP/SFTP) plug in through this interface.
class DestinationHandler {
public:
    virtual ~DestinationHandler() = default;

    virtual std::string type() const = 0;

    // Stores files for the backup and returns their stored locations, in the
    // same order. Throws BackupError on failure.
    virtual std::vector<std::string> upload(const std::vector<std::string>& files,
                                            const BackupDestination& destination,
                                            const BackupMetadata& metadata) = 0;

    // Writes the metadata record next to the stored artifacts.
    virtual bool writeMetadata(const BackupMetadata& metadata,
                               const BackupDestination& destination) = 0;

    // Removes everything stored for the backup. Removing something already
    // gone succeeds.
    virtual bool remove(const BackupMetadata& metadata,
                        const BackupDestination& destination) = 0;
};

using DestinationHandlerPtr = std::shared_ptr<DestinationHandler>;

// Copies artifacts to <path>/<storageType>/<backupId>/ on a local filesystem.
class LocalDestinationHandler : public DestinationHandler {
public:
    std::string type() const override { return "local"; }

    std::vector<std::string> upload(const std::vector<std::string>& files,
                                    const BackupDestination& destination,
                                    const BackupMetadata& metadata) override;
    bool writeMetadata(const BackupMetadata& metadata,
                       const BackupDestination& destination) override;
    bool remove(const BackupMetadata& metadata,
                const BackupDestination& destination) override;

    static std::string backupDirectory(const BackupDestination& destination,
                                       const BackupMetadata& metadata);
};
