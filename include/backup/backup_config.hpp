#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/backup_status.hpp"

struct BackupSchedule {
    std::string cron{"0 2 * * *"};
    std::string timezone{"UTC"};
    bool enabled{true};
    int retries{3};
    int timeoutMinutes{60};
};

struct RetentionPolicy {
    int dailyRetentionDays{7};
    int weeklyRetentionWeeks{4};
    int monthlyRetentionMonths{12};
    int maxBackups{100};
    bool autoCleanup{true};
};

struct BackupDestination {
    std::string type{"local"};   // local, aws-s3, azure-blob, gcp-storage, ftp, sftp
    std::string path;
    nlohmann::json options = nlohmann::json::object();
    bool encryption{false};
};

struct StorageBackupConfig {
    std::string type;
    bool enabled{true};
    BackupKind backupType{BackupKind::Full};
    CompressionType compression{CompressionType::Gzip};
    std::vector<std::string> preBackupHooks;
    std::vector<std::string> postBackupHooks;
    // Backend-specific options, e.g. {"format": "custom", "excludeTables": []}
    nlohmann::json options = nlohmann::json::object();
    // Per-type schedule override; empty cron means use the default schedule
    std::string scheduleCron;
};

struct GlobalSettings {
    int maxParallelJobs{3};
    bool enableVerification{true};
    std::vector<VerificationType> verificationTypes{VerificationType::Checksum,
                                                    VerificationType::SizeValidation};
    int verificationTimeoutSeconds{300};
    bool parallelVerification{true};
    // storage type -> integrity-check scripts, run as <script> <backupId> <destinationPath>
    std::map<std::string, std::vector<std::string>> customVerificationScripts;
    std::string scratchDirectory{"temp"};
    std::string reportDirectory{"backup-reports"};
    std::string catalogDirectory{"./backups/catalog"};
};

struct BackupConfig {
    bool enabled{true};
    std::vector<StorageBackupConfig> storageConfigs;
    std::vector<BackupDestination> destinations;
    BackupSchedule defaultSchedule;
    RetentionPolicy retentionPolicy;
    GlobalSettings global;

    const StorageBackupConfig* findStorageConfig(const std::string& type) const;
    StorageBackupConfig* findStorageConfig(const std::string& type);
};

extern const std::vector<std::string> kDestinationTypes;

// Built from BACKUP_* environment variables over built-in defaults.
BackupConfig createDefaultBackupConfig();

// Default option bag for a storage type (currently only "postgres" has one).
nlohmann::json defaultStorageOptions(const std::string& storageType);

// Reads a JSON file and merges it over createDefaultBackupConfig(). A file
// that is missing or unreadable is logged and the defaults are returned.
BackupConfig loadBackupConfig(const std::string& path);
bool saveBackupConfig(const BackupConfig& config, const std::string& path);

// Applies a JSON overlay: scalars replace, storageConfigs merge by type,
// destinations replace the list when given.
BackupConfig mergeBackupConfig(const BackupConfig& base, const nlohmann::json& overrides);

// Throws BackupError(InvalidConfig) describing every violated constraint.
void validateBackupConfig(const BackupConfig& config);

void to_json(nlohmann::json& j, const BackupSchedule& s);
void from_json(const nlohmann::json& j, BackupSchedule& s);
void to_json(nlohmann::json& j, const RetentionPolicy& r);
void from_json(const nlohmann::json& j, RetentionPolicy& r);
void to_json(nlohmann::json& j, const BackupDestination& d);
void from_json(const nlohmann::json& j, BackupDestination& d);
void to_json(nlohmann::json& j, const StorageBackupConfig& s);
void from_json(const nlohmann::json& j, StorageBackupConfig& s);
void to_json(nlohmann::json& j, const GlobalSettings& g);
void from_json(const nlohmann::json& j, GlobalSettings& g);
void to_json(nlohmann::json& j, const BackupConfig& c);
void from_json(const nlohmann::json& j, BackupConfig& c);
