#pragma once

#include <string>
#include <vector>

#include "backup/backup_config.hpp"
#include "backup/backup_metadata.hpp"

struct RetentionDecision {
    std::vector<std::string> keep;     // newest first
    std::vector<std::string> remove;   // newest first
};

// Tiered retention for the backups of one storage type. Everything since
// the daily cutoff is kept, then the newest backup of each ISO week up to the
// weekly cutoff, then the newest of each calendar month up to the monthly
// cutoff (months count as 30 days). A keep-set larger than maxBackups is
// trimmed to its newest entries.
RetentionDecision computeRetention(std::vector<BackupMetadata> backups,
                                   const RetentionPolicy& policy,
                                   TimePoint now);
