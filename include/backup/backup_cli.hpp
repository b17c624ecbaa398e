#pragma once

#include "backup/backup_manager.hpp"
#include <memory>
#include <string>
#include <vector>

// Command front end over a BackupManager. Each handler returns the process
// exit code.
class BackupCLI {
public:
    explicit BackupCLI(std::shared_ptr<BackupManager> manager);

    int run(const std::vector<std::string>& args);
    static void printUsage();

private:
    int handleDaemonCommand();
    int handleBackupCommand(const std::vector<std::string>& args);
    int handleListCommand(const std::vector<std::string>& args);
    int handleRestoreCommand(const std::vector<std::string>& args);
    int handleVerifyCommand(const std::vector<std::string>& args);
    int handleDeleteCommand(const std::vector<std::string>& args);
    int handleCleanupCommand();
    int handleStatsCommand();
    int handleConfigCommand();

    // Polls until the job is terminal, printing its progress. True if it completed.
    bool waitForCompletion(const std::string& jobId);
    std::string formatTime(TimePoint time) const;

    std::shared_ptr<BackupManager> manager_;
};
