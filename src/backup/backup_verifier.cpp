#include "backup/backup_verifier.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/parallel_task_manager.hpp"
#include "common/process_runner.hpp"
#include "common/scoped_directory.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct FileCheck {
    std::string file;
    std::string error;
};

FileCheck checkOneFile(const std::string& file, const std::map<std::string, std::string>& checksums) {
    auto expected = checksums.find(file);
    if (expected == checksums.end()) {
        return {file, "No checksum recorded: " + file};
    }
    if (!fs::exists(file)) {
        return {file, "File not found: " + file};
    }
    if (utils::sha256Path(file) != expected->second) {
        return {file, "Checksum mismatch: " + file};
    }
    return {file, ""};
}

} // namespace

BackupVerifier::BackupVerifier(VerificationConfig config)
    : config_(std::move(config)) {
    if (config_.maxParallelJobs < 1) {
        config_.maxParallelJobs = 1;
    }
}

VerificationResult BackupVerifier::verifyBackup(const BackupMetadata& metadata,
                                                const std::string& type,
                                                StorageBackendPtr backend) {
    try {
        return verifyBackup(metadata, parseVerificationType(type), backend);
    } catch (const BackupError& e) {
        VerificationResult result;
        result.type = type;
        result.timestamp = utils::now();
        result.errors.push_back(e.what());
        return result;
    }
}

VerificationResult BackupVerifier::verifyBackup(const BackupMetadata& metadata,
                                                VerificationType type,
                                                StorageBackendPtr backend) {
    VerificationResult result;
    result.type = toString(type);
    result.timestamp = utils::now();
    auto started = std::chrono::steady_clock::now();

    Logger::info("Running " + result.type + " verification for " + metadata.id);
    try {
        switch (type) {
            case VerificationType::Checksum:
                verifyChecksums(metadata, result);
                break;
            case VerificationType::SizeValidation:
                verifySizes(metadata, result);
                break;
            case VerificationType::IntegrityCheck:
                verifyIntegrity(metadata, backend, result);
                break;
            case VerificationType::RestoreTest:
                verifyRestore(metadata, backend, result);
                break;
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Verification error: ") + e.what());
    }

    result.passed = result.errors.empty();
    result.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (result.passed) {
        Logger::info(result.type + " verification passed for " + metadata.id +
                     (result.warnings.empty() ? "" : " with " + std::to_string(result.warnings.size()) + " warning(s)"));
    } else {
        Logger::error(result.type + " verification failed for " + metadata.id + ": " + result.errors.front());
    }
    if (config_.verbose) {
        for (const auto& warning : result.warnings) {
            Logger::warning(result.type + ": " + warning);
        }
    }
    return result;
}

void BackupVerifier::verifyChecksums(const BackupMetadata& metadata, VerificationResult& result) {
    std::vector<FileCheck> checks;
    checks.reserve(metadata.files.size());

    if (config_.enableParallelChecks && metadata.files.size() > 1) {
        ParallelTaskManager pool(static_cast<size_t>(config_.maxParallelJobs));
        std::vector<std::future<FileCheck>> futures;
        for (const auto& file : metadata.files) {
            futures.push_back(pool.addTask([&metadata, file]() {
                return checkOneFile(file, metadata.checksums);
            }));
        }
        for (auto& future : futures) {
            checks.push_back(future.get());
        }
    } else {
        for (const auto& file : metadata.files) {
            checks.push_back(checkOneFile(file, metadata.checksums));
        }
    }

    size_t verified = 0;
    for (const auto& check : checks) {
        if (check.error.empty()) {
            ++verified;
        } else {
            result.errors.push_back(check.error);
        }
    }

    result.details = {
        {"totalFiles", metadata.files.size()},
        {"verifiedFiles", verified},
        {"failedFiles", metadata.files.size() - verified},
        {"algorithm", "sha256"},
    };
}

void BackupVerifier::verifySizes(const BackupMetadata& metadata, VerificationResult& result) {
    uint64_t totalSize = 0;
    size_t emptyFiles = 0;
    size_t presentFiles = 0;
    json missing = json::array();

    for (const auto& file : metadata.files) {
        std::error_code ec;
        if (!fs::exists(file, ec)) {
            result.errors.push_back("Missing file: " + fs::path(file).filename().string());
            missing.push_back(file);
            continue;
        }
        ++presentFiles;
        uint64_t size = utils::pathSize(file);
        if (size == 0) {
            ++emptyFiles;
        }
        totalSize += size;
    }

    if (emptyFiles > 0) {
        result.warnings.push_back(std::to_string(emptyFiles) + " empty files found");
    }

    uint64_t expectedSize = metadata.compressedSize.value_or(metadata.size);
    if (expectedSize > 0 && presentFiles == metadata.files.size() && totalSize != expectedSize) {
        result.warnings.push_back("Size differs from recorded value: observed " +
                                  std::to_string(totalSize) + " bytes, recorded " +
                                  std::to_string(expectedSize) + " bytes");
    }

    result.details = {
        {"totalSize", totalSize},
        {"expectedSize", expectedSize},
        {"averageFileSize", presentFiles ? totalSize / presentFiles : 0},
        {"fileCount", metadata.files.size()},
        {"emptyFiles", emptyFiles},
        {"missingFiles", missing},
    };
}

void BackupVerifier::verifyIntegrity(const BackupMetadata& metadata, StorageBackendPtr backend,
                                     VerificationResult& result) {
    if (!backend) {
        result.errors.push_back("No storage handler provided for integrity check");
        return;
    }

    bool backendOk = backend->verifyBackup(metadata, VerificationType::IntegrityCheck);
    if (!backendOk) {
        std::string reason = backend->getLastError();
        result.errors.push_back("Backend integrity check failed" + (reason.empty() ? "" : ": " + reason));
    }
    result.details["backendCheck"] = backendOk;

    runCustomScripts(metadata, result);
}

void BackupVerifier::runCustomScripts(const BackupMetadata& metadata, VerificationResult& result) {
    json scripts = json::array();
    auto it = config_.customScripts.find(metadata.storageType);
    if (it != config_.customScripts.end()) {
        for (const auto& script : it->second) {
            json entry{{"script", script}};
            ProcessOptions options;
            options.timeout = std::chrono::seconds(config_.timeoutSeconds);
            try {
                ProcessResult run = ProcessRunner::run(script, {metadata.id, metadata.destination.path}, options);
                entry["exitCode"] = run.exitCode;
                entry["output"] = utils::trim(run.stdoutText);
                if (run.timedOut) {
                    result.errors.push_back("Custom verification script timed out: " + script);
                } else if (run.exitCode != 0) {
                    result.errors.push_back("Custom verification script failed: " + script +
                                            " (exit " + std::to_string(run.exitCode) + ")");
                }
            } catch (const BackupError& e) {
                entry["error"] = e.what();
                result.errors.push_back("Custom verification script error: " + script + ": " + e.what());
            }
            scripts.push_back(entry);
        }
    }
    result.details["customScripts"] = scripts;
}

void BackupVerifier::verifyRestore(const BackupMetadata& metadata, StorageBackendPtr backend,
                                   VerificationResult& result) {
    if (!backend) {
        result.errors.push_back("No storage handler provided for restore test");
        return;
    }

    ScopedDirectory testDir(fs::path(config_.scratchDirectory) / "restore-test" / metadata.id);
    result.details["testDirectory"] = testDir.string();

    RestoreOptions options;
    options.backupId = metadata.id;
    options.targetPath = testDir.string();
    options.overwrite = true;
    options.verify = false;

    try {
        if (!backend->restoreBackup(metadata, options, nullptr)) {
            std::string reason = backend->getLastError();
            result.errors.push_back("Test restore failed" + (reason.empty() ? "" : ": " + reason));
        } else {
            size_t restored = utils::listFilesRecursive(testDir.string()).size();
            result.details["restoredFiles"] = restored;
            if (restored == 0) {
                result.warnings.push_back("No files found after restore");
            }
        }
    } catch (const std::exception& e) {
        result.errors.push_back(std::string("Test restore failed: ") + e.what());
    }

    std::string cleanupError = testDir.remove();
    if (!cleanupError.empty()) {
        result.warnings.push_back("Failed to cleanup test directory: " + cleanupError);
    }
}

std::vector<VerificationResult> BackupVerifier::verifyBackupComprehensive(
    const BackupMetadata& metadata,
    const std::vector<VerificationType>& types,
    StorageBackendPtr backend) {
    std::vector<VerificationResult> results;
    results.reserve(types.size());

    if (!config_.enableParallelChecks || types.size() <= 1) {
        for (auto type : types) {
            results.push_back(verifyBackup(metadata, type, backend));
        }
        return results;
    }

    size_t chunk = static_cast<size_t>(config_.maxParallelJobs);
    for (size_t start = 0; start < types.size(); start += chunk) {
        size_t end = std::min(types.size(), start + chunk);
        std::vector<std::future<VerificationResult>> futures;
        for (size_t i = start; i < end; ++i) {
            VerificationType type = types[i];
            futures.push_back(std::async(std::launch::async, [this, &metadata, type, backend]() {
                return verifyBackup(metadata, type, backend);
            }));
        }
        for (auto& future : futures) {
            results.push_back(future.get());
        }
    }
    return results;
}

bool BackupVerifier::allPassed(const std::vector<VerificationResult>& results) {
    return std::all_of(results.begin(), results.end(),
                       [](const VerificationResult& r) { return r.passed; });
}

json BackupVerifier::createVerificationReport(const BackupMetadata& metadata,
                                              const std::vector<VerificationResult>& results) const {
    size_t passedChecks = 0;
    int64_t totalDuration = 0;
    for (const auto& result : results) {
        if (result.passed) {
            ++passedChecks;
        }
        totalDuration += result.durationMs;
    }
    double successRate = results.empty()
        ? 0.0
        : static_cast<double>(passedChecks) / static_cast<double>(results.size()) * 100.0;

    return json{
        {"backupId", metadata.id},
        {"storageType", metadata.storageType},
        {"backupType", toString(metadata.backupType)},
        {"backupSize", metadata.size},
        {"verificationTimestamp", utils::formatIsoTime(utils::now())},
        {"overallResult", {
            {"passed", !results.empty() && passedChecks == results.size()},
            {"successRate", successRate},
            {"totalDuration", totalDuration},
            {"totalChecks", results.size()},
            {"passedChecks", passedChecks},
            {"failedChecks", results.size() - passedChecks},
        }},
        {"verifications", results},
        {"metadata", {
            {"backupCreated", utils::formatIsoTime(metadata.startTime)},
            {"backupCompleted", metadata.endTime ? json(utils::formatIsoTime(*metadata.endTime)) : json(nullptr)},
            {"files", metadata.files.size()},
            {"compression", toString(metadata.compression)},
            {"version", metadata.version},
        }},
    };
}

std::string BackupVerifier::saveVerificationReport(const json& report, const std::string& path) const {
    std::string target = path;
    if (target.empty()) {
        target = (fs::path(config_.reportDirectory) /
                  ("verification-" + report.value("backupId", std::string("unknown")) + "-" +
                   std::to_string(utils::toMillis(utils::now())) + ".json")).string();
    }

    std::error_code ec;
    fs::path parent = fs::path(target).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream out(target);
    if (!out.is_open()) {
        Logger::error("Failed to save verification report to " + target);
        return "";
    }
    out << report.dump(2) << std::endl;
    if (!out.good()) {
        Logger::error("Failed to write verification report " + target);
        return "";
    }
    Logger::info("Verification report saved: " + target);
    return target;
}

std::vector<VerificationResult> BackupVerifier::verifyAndReport(const BackupMetadata& metadata,
                                                                const std::vector<VerificationType>& types,
                                                                StorageBackendPtr backend,
                                                                std::string* reportPath) {
    auto results = verifyBackupComprehensive(metadata, types, backend);
    json report = createVerificationReport(metadata, results);
    if (!report["overallResult"]["passed"].get<bool>()) {
        std::string saved = saveVerificationReport(report);
        if (reportPath) {
            *reportPath = saved;
        }
    }
    return results;
}

std::vector<VerificationResult> BackupVerifier::quickVerify(const BackupMetadata& metadata,
                                                            StorageBackendPtr backend) {
    return verifyBackupComprehensive(
        metadata, {VerificationType::Checksum, VerificationType::SizeValidation}, backend);
}

void to_json(json& j, const VerificationResult& r) {
    j = json{
        {"type", r.type},
        {"passed", r.passed},
        {"details", r.details},
        {"errors", r.errors},
        {"warnings", r.warnings},
        {"duration", r.durationMs},
        {"timestamp", utils::formatIsoTime(r.timestamp)},
    };
}
