#include "backup/backup_cli.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::atomic<bool> g_stopRequested{false};

void handleStopSignal(int) {
    g_stopRequested = true;
}

} // namespace

BackupCLI::BackupCLI(std::shared_ptr<BackupManager> manager)
    : manager_(std::move(manager)) {
}

void BackupCLI::printUsage() {
    std::cout << "Usage: unibackup [--config file] [--log file] [--log-level level] <command> [options]\n"
              << "Commands:\n"
              << "  daemon                         Run scheduled backups until interrupted\n"
              << "  backup <type>|all              Run a backup now and wait for it\n"
              << "  list [--type t] [--status s]   List backup jobs\n"
              << "  restore <backupId> [--target dir] [--overwrite] [--verify]\n"
              << "                                 Restore a backup (--overwrite destroys existing data)\n"
              << "  verify <backupId> [--type t]   Verify a backup (checksum, size-validation,\n"
              << "                                 integrity-check, restore-test)\n"
              << "  delete <backupId>              Delete a backup from every destination\n"
              << "  cleanup                        Apply the retention policy\n"
              << "  stats                          Show backup statistics\n"
              << "  config                         Print the effective configuration\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help    Show this help message\n"
              << "  -v, --version Show version information\n";
}

int BackupCLI::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        if (command == "daemon") {
            return handleDaemonCommand();
        } else if (command == "backup") {
            return handleBackupCommand(rest);
        } else if (command == "list") {
            return handleListCommand(rest);
        } else if (command == "restore") {
            return handleRestoreCommand(rest);
        } else if (command == "verify") {
            return handleVerifyCommand(rest);
        } else if (command == "delete") {
            return handleDeleteCommand(rest);
        } else if (command == "cleanup") {
            return handleCleanupCommand();
        } else if (command == "stats") {
            return handleStatsCommand();
        } else if (command == "config") {
            return handleConfigCommand();
        }
    } catch (const BackupError& e) {
        std::cerr << "Error (" << toString(e.code()) << "): " << e.what() << std::endl;
        Logger::error("Command " + command + " failed: " + e.what());
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::error("Command " + command + " failed: " + e.what());
        return 1;
    }

    std::cerr << "Error: Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

int BackupCLI::handleDaemonCommand() {
    manager_->initialize();

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    std::cout << "Backup daemon running, press Ctrl+C to stop" << std::endl;
    for (const auto& next : manager_->getNextScheduledBackups()) {
        std::cout << "  " << next.first << ": next run " << formatTime(next.second) << "\n";
    }

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    Logger::info("Stop signal received");
    manager_->shutdown();
    std::cout << "Backup daemon stopped" << std::endl;
    return 0;
}

int BackupCLI::handleBackupCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: backup requires a storage type or 'all'" << std::endl;
        return 1;
    }
    manager_->initialize();

    if (args[0] == "all") {
        auto results = manager_->startFullBackup();
        std::cout << "Started " << results.size() << " backup(s)" << std::endl;
        while (!manager_->waitForIdle(std::chrono::seconds(1))) {
            std::cout << "." << std::flush;
        }
        std::cout << std::endl;

        int failures = 0;
        for (const auto& result : results) {
            auto jobId = manager_->resolveTicket(result.ticket);
            auto status = jobId ? manager_->getBackupStatus(*jobId) : std::nullopt;
            if (!status) {
                std::cout << result.ticket << ": not started\n";
                ++failures;
                continue;
            }
            std::cout << status->id << " (" << status->storageType << "): " << toString(status->status);
            if (status->error) {
                std::cout << " - " << status->error->message;
            }
            std::cout << "\n";
            if (status->status != BackupStatus::Completed) {
                ++failures;
            }
        }
        return failures == 0 ? 0 : 1;
    }

    StartBackupResult result = manager_->startBackup(args[0]);
    std::optional<std::string> jobId = result.jobId;
    if (result.queued) {
        std::cout << "Backup queued (ticket " << result.ticket << ")" << std::endl;
        while (!jobId) {
            auto ticket = manager_->getTicketStatus(result.ticket);
            if (!ticket || ticket->state == TicketState::Rejected) {
                std::cerr << "Error: queued backup was rejected"
                          << (ticket ? ": " + ticket->error : std::string()) << std::endl;
                return 1;
            }
            jobId = ticket->jobId;
            if (!jobId) {
                std::this_thread::sleep_for(std::chrono::milliseconds(500));
            }
        }
    }

    std::cout << "Backup job " << *jobId << " started" << std::endl;
    return waitForCompletion(*jobId) ? 0 : 1;
}

bool BackupCLI::waitForCompletion(const std::string& jobId) {
    std::optional<BackupJobSnapshot> status;
    while (true) {
        status = manager_->getBackupStatus(jobId);
        if (!status) {
            std::cerr << "\nError: job " << jobId << " disappeared" << std::endl;
            return false;
        }
        std::cout << "\rProgress: " << status->progress << "% " << status->currentOperation
                  << "          " << std::flush;
        if (isTerminal(status->status)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    // Let the worker finish writing metadata before the process exits
    manager_->waitForIdle(std::chrono::seconds(30));

    std::cout << "\nBackup job " << (status->status == BackupStatus::Completed ? "completed successfully" : toString(status->status))
              << std::endl;
    if (status->error) {
        std::cerr << "Error: " << status->error->message << std::endl;
    }
    if (status->status == BackupStatus::Completed) {
        std::cout << "Files: " << status->metadata.files.size()
                  << ", size: " << utils::formatBytes(status->metadata.size) << std::endl;
    }
    return status->status == BackupStatus::Completed;
}

int BackupCLI::handleListCommand(const std::vector<std::string>& args) {
    manager_->initialize();

    JobListFilters filters;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--type" && i + 1 < args.size()) {
            filters.storageType = args[++i];
        } else if (args[i] == "--status" && i + 1 < args.size()) {
            filters.status = parseBackupStatus(args[++i]);
        } else if (args[i] == "--active") {
            filters.activeOnly = true;
        }
    }

    auto jobs = manager_->listJobs(filters);
    if (jobs.empty()) {
        std::cout << "No backups\n";
        return 0;
    }

    std::cout << std::left << std::setw(48) << "ID" << std::setw(12) << "TYPE" << std::setw(12) << "STATUS"
              << std::setw(22) << "STARTED" << "SIZE\n";
    for (const auto& job : jobs) {
        std::cout << std::left << std::setw(48) << job.id << std::setw(12) << job.storageType
                  << std::setw(12) << toString(job.status) << std::setw(22) << formatTime(job.startTime)
                  << utils::formatBytes(job.metadata.size) << "\n";
    }
    return 0;
}

int BackupCLI::handleRestoreCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: restore requires a backup id" << std::endl;
        return 1;
    }

    RestoreOptions options;
    options.backupId = args[0];
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--target" && i + 1 < args.size()) {
            options.targetPath = args[++i];
        } else if (args[i] == "--overwrite") {
            options.overwrite = true;
        } else if (args[i] == "--verify") {
            options.verify = true;
        } else if (args[i] == "--file" && i + 1 < args.size()) {
            options.files.push_back(args[++i]);
        }
    }

    manager_->initialize();
    if (options.overwrite) {
        std::cout << "Warning: --overwrite replaces the existing data" << std::endl;
    }
    bool restored = manager_->restoreBackup(options.backupId, options);
    std::cout << "Restore " << (restored ? "completed successfully" : "failed") << std::endl;
    return restored ? 0 : 1;
}

int BackupCLI::handleVerifyCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: verify requires a backup id" << std::endl;
        return 1;
    }

    std::optional<VerificationType> type;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--type" && i + 1 < args.size()) {
            type = parseVerificationType(args[++i]);
        }
    }

    manager_->initialize();
    bool passed = manager_->verifyBackup(args[0], type);
    std::cout << "Verification " << (passed ? "passed" : "failed") << std::endl;
    return passed ? 0 : 1;
}

int BackupCLI::handleDeleteCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Error: delete requires a backup id" << std::endl;
        return 1;
    }
    manager_->initialize();
    bool deleted = manager_->deleteBackup(args[0]);
    std::cout << "Backup " << args[0] << (deleted ? " deleted" : " not deleted") << std::endl;
    return deleted ? 0 : 1;
}

int BackupCLI::handleCleanupCommand() {
    manager_->initialize();
    size_t deleted = manager_->cleanupOldBackups();
    std::cout << "Deleted " << deleted << " old backup(s)" << std::endl;
    return 0;
}

int BackupCLI::handleStatsCommand() {
    manager_->initialize();
    std::cout << json(manager_->getStatistics()).dump(2) << std::endl;
    return 0;
}

int BackupCLI::handleConfigCommand() {
    std::cout << json(manager_->getConfig()).dump(2) << std::endl;
    return 0;
}

std::string BackupCLI::formatTime(TimePoint time) const {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
