#include "backup/backup_job.hpp"
#include "backup/base_storage_backend.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include "common/scoped_directory.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

BackupJob::BackupJob(const std::string& storageType,
                     const StorageBackupConfig& config,
                     const BackupDestination& destination)
    : Job(generateId(storageType))
    , storageType_(storageType)
    , config_(config)
    , destination_(destination) {
    metadata_.id = id_;
    metadata_.storageType = storageType_;
    metadata_.backupType = config_.backupType;
    metadata_.status = BackupStatus::Pending;
    metadata_.startTime = startTime_;
    metadata_.compression = config_.compression;
    metadata_.destination = {destination_.type, destination_.path};
    metadata_.tags = {storageType_, toString(config_.backupType)};
    metadata_.version = kMetadataVersion;
}

bool BackupJob::cancel() {
    if (!Job::cancel()) {
        return false;
    }
    Logger::info("Backup job " + id_ + " cancelled");
    return true;
}

void BackupJob::onTerminalLocked(BackupStatus state) {
    metadata_.status = state;
    metadata_.endTime = endTime_;
}

void BackupJob::execute(const BackupJobContext& context) {
    if (!setState(BackupStatus::Running)) {
        Logger::info("Backup job " + id_ + " was not started: already " + toString(getState()));
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_.status = BackupStatus::Running;
        metadata_.startTime = startTime_;
    }
    Logger::info("Starting backup job " + id_ + " for " + storageType_);

    try {
        runStages(context);
    } catch (const BackupError& e) {
        if (e.code() == BackupErrorCode::Cancelled || token_->isCancelled()) {
            // cancel() already recorded the terminal state
            Logger::info("Backup job " + id_ + " stopped after cancellation");
            return;
        }
        fail(e.what(), toString(e.code()));
    } catch (const std::exception& e) {
        if (token_->isCancelled()) {
            return;
        }
        fail(e.what(), toString(BackupErrorCode::Internal));
    }
}

void BackupJob::runStages(const BackupJobContext& context) {
    if (!context.backend) {
        throw BackupError(BackupErrorCode::NoHandler, "No backend for " + storageType_);
    }

    updateProgress(10, "Initializing backup");
    ScopedDirectory scratch(fs::path(context.scratchRoot) / id_);

    if (!config_.preBackupHooks.empty()) {
        updateProgress(20, "Running pre-backup hooks");
        runHooks(config_.preBackupHooks, "pre-backup", scratch.string(), context);
    }
    token_->throwIfCancelled();

    updateProgress(30, "Creating backup");
    std::vector<std::string> files = createWithRetries(context, scratch.string());
    token_->throwIfCancelled();

    std::map<std::string, std::string> scratchChecksums = BaseStorageBackend::calculateChecksums(files);
    uint64_t size = 0;
    for (const auto& file : files) {
        size += utils::pathSize(file);
    }

    updateProgress(60, "Uploading to destinations");
    if (context.destinations.empty()) {
        throw BackupError(BackupErrorCode::NoHandler, "No destination configured for " + id_);
    }

    BackupMetadata snapshotForUpload = getMetadata();
    std::vector<std::string> storedFiles;
    for (const auto& destination : context.destinations) {
        if (!destination.second) {
            throw BackupError(BackupErrorCode::NoHandler,
                              "No handler for destination type " + destination.first.type);
        }
        auto stored = destination.second->upload(files, destination.first, snapshotForUpload);
        if (storedFiles.empty()) {
            storedFiles = stored;
        }
        token_->throwIfCancelled();
    }

    // Metadata points at the first destination's copies
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_.files = storedFiles;
        metadata_.checksums.clear();
        for (size_t i = 0; i < files.size() && i < storedFiles.size(); ++i) {
            metadata_.checksums[storedFiles[i]] = scratchChecksums[files[i]];
        }
        metadata_.size = size;
        if (config_.compression == CompressionType::Gzip) {
            metadata_.compressedSize = size;
        }
        metadata_.destination = {context.destinations.front().first.type,
                                 context.destinations.front().first.path};
        metadata_.sourceConfig = json{{"options", config_.options}};
        metadata_.metadata["fileCount"] = storedFiles.size();
    }

    if (context.verify && context.verifier && !context.verificationTypes.empty()) {
        updateProgress(80, "Verifying backup");
        BackupMetadata toVerify = getMetadata();
        auto results = context.verifier->verifyAndReport(toVerify, context.verificationTypes, context.backend);

        std::vector<std::string> failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            metadata_.verification.clear();
            for (const auto& result : results) {
                VerificationSummary summary;
                summary.type = parseVerificationType(result.type);
                summary.passed = result.passed;
                summary.details = result.details;
                metadata_.verification.push_back(summary);
                if (!result.passed) {
                    failed.push_back(result.type);
                }
            }
        }
        if (!failed.empty()) {
            std::stringstream ss;
            ss << "Backup verification failed: ";
            for (size_t i = 0; i < failed.size(); ++i) {
                ss << (i ? ", " : "") << failed[i];
            }
            throw BackupError(BackupErrorCode::VerificationFailed, ss.str());
        }
    }
    token_->throwIfCancelled();

    if (!config_.postBackupHooks.empty()) {
        updateProgress(90, "Running post-backup hooks");
        runHooks(config_.postBackupHooks, "post-backup", scratch.string(), context);
    }

    updateProgress(95, "Cleaning up");
    std::string cleanupError = scratch.remove();
    if (!cleanupError.empty()) {
        Logger::warning("Failed to remove scratch directory for " + id_ + ": " + cleanupError);
    }

    updateProgress(100, "Completed");
    if (!setState(BackupStatus::Completed)) {
        return;
    }

    BackupMetadata finished = getMetadata();
    for (const auto& destination : context.destinations) {
        if (!destination.second->writeMetadata(finished, destination.first)) {
            Logger::warning("Failed to write metadata for " + id_ + " to " + destination.first.path);
        }
    }

    Logger::info("Backup job " + id_ + " completed: " + std::to_string(finished.files.size()) +
                 " file(s), " + utils::formatBytes(finished.size));
}

std::vector<std::string> BackupJob::createWithRetries(const BackupJobContext& context,
                                                      const std::string& scratchDir) {
    int attempt = 0;
    while (true) {
        try {
            return context.backend->createBackup(config_, scratchDir, token_);
        } catch (const BackupError& e) {
            bool retryable = e.code() == BackupErrorCode::ExternalToolFailure ||
                             e.code() == BackupErrorCode::Timeout;
            if (!retryable || attempt >= context.retries || token_->isCancelled()) {
                throw;
            }
            ++attempt;
            Logger::warning("Backup attempt " + std::to_string(attempt) + " for " + id_ +
                            " failed, retrying: " + e.what());
        }

        auto deadline = std::chrono::steady_clock::now() + context.retryDelay * attempt;
        while (std::chrono::steady_clock::now() < deadline) {
            token_->throwIfCancelled();
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
}

void BackupJob::runHooks(const std::vector<std::string>& hooks, const std::string& stage,
                         const std::string& scratchDir, const BackupJobContext& context) {
    ProcessOptions options;
    options.timeout = context.hookTimeout;
    options.cancelToken = token_;
    options.env["BACKUP_ID"] = id_;
    options.env["BACKUP_STORAGE_TYPE"] = storageType_;
    options.env["BACKUP_DIR"] = scratchDir;
    options.env["BACKUP_STAGE"] = stage;

    for (const auto& hook : hooks) {
        Logger::info("Running " + stage + " hook for " + id_ + ": " + hook);
        ProcessResult result = ProcessRunner::runShell(hook, options);
        if (result.cancelled) {
            throw BackupError(BackupErrorCode::Cancelled, stage + " hook cancelled");
        }
        if (result.timedOut) {
            throw BackupError(BackupErrorCode::Timeout, stage + " hook timed out: " + hook);
        }
        if (result.exitCode != 0) {
            throw ProcessError(stage + " hook failed (exit " + std::to_string(result.exitCode) + "): " + hook,
                               result.exitCode, result.stdoutText, result.stderrText);
        }
    }
}

void BackupJob::fail(const std::string& message, const std::string& code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (::isTerminal(state_)) {
            return;
        }
        jobError_ = JobError{message, "", code};
        metadata_.error = jobError_;
    }
    Logger::error("Backup job " + id_ + " failed: " + message);
    setState(BackupStatus::Failed);
}

BackupJobSnapshot BackupJob::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BackupJobSnapshot s;
    s.id = id_;
    s.storageType = storageType_;
    s.status = state_;
    s.progress = progress_;
    s.currentOperation = currentOperation_;
    s.startTime = startTime_;
    s.endTime = endTime_;
    s.error = jobError_;
    s.config = config_;
    s.destination = destination_;
    s.metadata = metadata_;
    s.metadata.status = state_;
    return s;
}

BackupMetadata BackupJob::getMetadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

void to_json(json& j, const BackupJobSnapshot& s) {
    j = json{
        {"id", s.id},
        {"storageType", s.storageType},
        {"status", toString(s.status)},
        {"progress", s.progress},
        {"currentOperation", s.currentOperation},
        {"startTime", utils::formatIsoTime(s.startTime)},
        {"endTime", s.endTime ? json(utils::formatIsoTime(*s.endTime)) : json(nullptr)},
        {"error", s.error ? json(*s.error) : json(nullptr)},
        {"config", s.config},
        {"destination", s.destination},
        {"metadata", s.metadata},
    };
}
