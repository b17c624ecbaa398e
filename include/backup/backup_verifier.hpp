#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "backup/backup_metadata.hpp"
#include "backup/storage_backend.hpp"

struct VerificationConfig {
    bool enableParallelChecks{true};
    int maxParallelJobs{3};
    int timeoutSeconds{300};
    bool verbose{false};
    // storage type -> scripts run as: <script> <backupId> <destinationPath>
    std::map<std::string, std::vector<std::string>> customScripts;
    std::string scratchDirectory{"temp"};
    std::string reportDirectory{"backup-reports"};
};

struct VerificationResult {
    std::string type;
    bool passed{false};
    nlohmann::json details = nlohmann::json::object();
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    int64_t durationMs{0};
    std::chrono::system_clock::time_point timestamp{};
};

// Runs verification strategies against a backup's metadata and artifacts.
// A strategy never throws; problems become errors in its result.
class BackupVerifier {
public:
    explicit BackupVerifier(VerificationConfig config = VerificationConfig{});

    // restore-test calls the backend's restoreBackup with overwrite=true and
    // a scratch targetPath. Backends that restore into a live service ignore
    // targetPath: PostgresBackend drops and recreates (plain) or cleans
    // (archive formats) its configured database, so restore-test against it
    // replaces that database's contents with the backup. Only enable it for
    // a backend whose connection points at a disposable database.
    VerificationResult verifyBackup(const BackupMetadata& metadata,
                                    VerificationType type,
                                    StorageBackendPtr backend = nullptr);

    // Accepts a type name; an unknown name yields a failed result.
    VerificationResult verifyBackup(const BackupMetadata& metadata,
                                    const std::string& type,
                                    StorageBackendPtr backend = nullptr);

    // Runs the strategies in chunks of maxParallelJobs when parallel checks
    // are enabled, otherwise one after another. Results keep the input order.
    std::vector<VerificationResult> verifyBackupComprehensive(const BackupMetadata& metadata,
                                                              const std::vector<VerificationType>& types,
                                                              StorageBackendPtr backend = nullptr);

    nlohmann::json createVerificationReport(const BackupMetadata& metadata,
                                            const std::vector<VerificationResult>& results) const;

    // Writes the report as JSON. Default path:
    // <reportDirectory>/verification-<backupId>-<epoch ms>.json
    // Returns the written path, empty on failure.
    std::string saveVerificationReport(const nlohmann::json& report,
                                       const std::string& path = "") const;

    // Comprehensive verification; the report is saved only when it failed.
    std::vector<VerificationResult> verifyAndReport(const BackupMetadata& metadata,
                                                    const std::vector<VerificationType>& types,
                                                    StorageBackendPtr backend = nullptr,
                                                    std::string* reportPath = nullptr);

    // checksum + size-validation
    std::vector<VerificationResult> quickVerify(const BackupMetadata& metadata,
                                                StorageBackendPtr backend = nullptr);

    static bool allPassed(const std::vector<VerificationResult>& results);

    const VerificationConfig& getConfig() const { return config_; }

private:
    void verifyChecksums(const BackupMetadata& metadata, VerificationResult& result);
    void verifySizes(const BackupMetadata& metadata, VerificationResult& result);
    void verifyIntegrity(const BackupMetadata& metadata, StorageBackendPtr backend,
                         VerificationResult& result);
    void verifyRestore(const BackupMetadata& metadata, StorageBackendPtr backend,
                       VerificationResult& result);
    void runCustomScripts(const BackupMetadata& metadata, VerificationResult& result);

    VerificationConfig config_;
};

void to_json(nlohmann::json& j, const VerificationResult& r);
