#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "backup/backup_metadata.hpp"

// File-backed index of finished backups, one <id>.json per record, so the
// history survives restarts.
class BackupCatalog {
public:
    explicit BackupCatalog(std::string directory);

    bool save(const BackupMetadata& metadata);
    bool remove(const std::string& backupId);

    // Unreadable records are logged and skipped.
    std::vector<BackupMetadata> loadAll() const;

    const std::string& directory() const { return directory_; }

private:
    std::string pathFor(const std::string& backupId) const;

    std::string directory_;
    mutable std::mutex mutex_;
};
