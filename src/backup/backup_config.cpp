#include "backup/backup_config.hpp"
#include "common/backup_error.hpp"
#include "common/cron_expression.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

const std::vector<std::string> kDestinationTypes = {
    "local", "aws-s3", "azure-blob", "gcp-storage", "ftp", "sftp"};

const StorageBackupConfig* BackupConfig::findStorageConfig(const std::string& type) const {
    for (const auto& storage : storageConfigs) {
        if (storage.type == type) {
            return &storage;
        }
    }
    return nullptr;
}

StorageBackupConfig* BackupConfig::findStorageConfig(const std::string& type) {
    for (auto& storage : storageConfigs) {
        if (storage.type == type) {
            return &storage;
        }
    }
    return nullptr;
}

json defaultStorageOptions(const std::string& storageType) {
    if (storageType == "postgres") {
        return json{
            {"format", "custom"},
            {"includeSchema", true},
            {"includeData", true},
            {"excludeTables", json::array()},
        };
    }
    return json::object();
}

BackupConfig createDefaultBackupConfig() {
    BackupConfig config;
    config.enabled = utils::getEnvBool("BACKUP_ENABLED", true);

    std::string basePath = utils::getEnvOr("BACKUP_BASE_PATH", "./backups");

    config.defaultSchedule.cron = utils::getEnvOr("BACKUP_DEFAULT_CRON", "0 2 * * *");
    config.defaultSchedule.timezone = utils::getEnvOr("BACKUP_DEFAULT_TIMEZONE", "UTC");
    config.defaultSchedule.enabled = utils::getEnvBool("BACKUP_SCHEDULE_ENABLED", true);
    config.defaultSchedule.retries = utils::getEnvInt("BACKUP_DEFAULT_RETRIES", 3);
    config.defaultSchedule.timeoutMinutes = utils::getEnvInt("BACKUP_DEFAULT_TIMEOUT", 60);

    config.retentionPolicy.dailyRetentionDays = utils::getEnvInt("BACKUP_DAILY_RETENTION_DAYS", 7);
    config.retentionPolicy.weeklyRetentionWeeks = utils::getEnvInt("BACKUP_WEEKLY_RETENTION_WEEKS", 4);
    config.retentionPolicy.monthlyRetentionMonths = utils::getEnvInt("BACKUP_MONTHLY_RETENTION_MONTHS", 12);
    config.retentionPolicy.maxBackups = utils::getEnvInt("BACKUP_MAX_BACKUPS", 100);
    config.retentionPolicy.autoCleanup = utils::getEnvBool("BACKUP_AUTO_CLEANUP", true);

    BackupDestination destination;
    destination.type = utils::getEnvOr("BACKUP_DESTINATION_TYPE", "local");
    destination.path = utils::getEnvOr("BACKUP_DESTINATION_PATH", basePath);
    config.destinations.push_back(destination);

    config.global.maxParallelJobs = utils::getEnvInt("BACKUP_MAX_PARALLEL_JOBS", 3);
    config.global.enableVerification = utils::getEnvBool("BACKUP_ENABLE_VERIFICATION", true);
    config.global.verificationTimeoutSeconds = utils::getEnvInt("BACKUP_VERIFY_TIMEOUT", 300);
    config.global.parallelVerification = utils::getEnvBool("BACKUP_PARALLEL_VERIFICATION", true);
    config.global.scratchDirectory = utils::getEnvOr("BACKUP_SCRATCH_DIR", "temp");
    config.global.reportDirectory = utils::getEnvOr("BACKUP_REPORT_DIR", "backup-reports");
    config.global.catalogDirectory = utils::getEnvOr("BACKUP_CATALOG_DIR", basePath + "/catalog");

    auto verificationTypes = utils::getEnv("BACKUP_VERIFICATION_TYPES");
    if (verificationTypes) {
        try {
            config.global.verificationTypes = parseVerificationTypes(*verificationTypes);
        } catch (const BackupError& e) {
            Logger::warning(std::string("Ignoring BACKUP_VERIFICATION_TYPES: ") + e.what());
        }
    }

    CompressionType compression = CompressionType::Gzip;
    try {
        compression = parseCompressionType(utils::getEnvOr("BACKUP_DEFAULT_COMPRESSION", "gzip"));
    } catch (const BackupError& e) {
        Logger::warning(std::string("Ignoring BACKUP_DEFAULT_COMPRESSION: ") + e.what());
    }

    if (utils::getEnvBool("BACKUP_POSTGRES_ENABLED", true)) {
        StorageBackupConfig postgres;
        postgres.type = "postgres";
        postgres.enabled = true;
        postgres.backupType = BackupKind::Full;
        postgres.compression = compression;
        postgres.options = defaultStorageOptions("postgres");
        config.storageConfigs.push_back(postgres);
    }

    return config;
}

BackupConfig mergeBackupConfig(const BackupConfig& base, const json& overrides) {
    json merged = base;
    if (!overrides.is_object()) {
        return base;
    }

    for (auto it = overrides.begin(); it != overrides.end(); ++it) {
        const std::string& key = it.key();
        if (key == "storageConfigs" && it.value().is_array()) {
            for (const auto& storage : it.value()) {
                std::string type = storage.value("type", "");
                bool found = false;
                for (auto& existing : merged["storageConfigs"]) {
                    if (existing.value("type", "") == type) {
                        existing.merge_patch(storage);
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    json entry = StorageBackupConfig{};
                    entry["options"] = defaultStorageOptions(type);
                    entry.merge_patch(storage);
                    merged["storageConfigs"].push_back(entry);
                }
            }
        } else if (key == "destinations" && it.value().is_array()) {
            merged["destinations"] = it.value();
        } else if (it.value().is_object() && merged.contains(key) && merged[key].is_object()) {
            merged[key].merge_patch(it.value());
        } else {
            merged[key] = it.value();
        }
    }
    return merged.get<BackupConfig>();
}

BackupConfig loadBackupConfig(const std::string& path) {
    BackupConfig defaults = createDefaultBackupConfig();

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warning("Backup configuration file not found, using defaults: " + path);
        return defaults;
    }

    try {
        json overrides = json::parse(file);
        BackupConfig config = mergeBackupConfig(defaults, overrides);
        Logger::info("Loaded backup configuration from " + path);
        return config;
    } catch (const std::exception& e) {
        Logger::error("Failed to load backup configuration from " + path + ": " + e.what());
        return defaults;
    }
}

bool saveBackupConfig(const BackupConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Failed to open configuration file for writing: " + path);
        return false;
    }
    file << json(config).dump(2) << std::endl;
    if (!file) {
        Logger::error("Failed to write configuration file: " + path);
        return false;
    }
    Logger::info("Saved backup configuration to " + path);
    return true;
}

namespace {

void checkRange(std::vector<std::string>& errors, const std::string& name, int value, int min, int max) {
    if (value < min || value > max) {
        std::stringstream ss;
        ss << name << " must be between " << min << " and " << max << " (got " << value << ")";
        errors.push_back(ss.str());
    }
}

void checkSchedule(std::vector<std::string>& errors, const std::string& cron, const std::string& timezone) {
    if (!CronExpression::isValid(cron)) {
        errors.push_back("invalid cron expression: " + cron);
    }
    if (!CronTimezone::parse(timezone)) {
        errors.push_back("unsupported timezone: " + timezone);
    }
}

} // namespace

void validateBackupConfig(const BackupConfig& config) {
    std::vector<std::string> errors;

    checkRange(errors, "global.maxParallelJobs", config.global.maxParallelJobs, 1, 10);
    checkRange(errors, "global.verificationTimeoutSeconds", config.global.verificationTimeoutSeconds, 1, 86400);
    checkRange(errors, "retentionPolicy.dailyRetentionDays", config.retentionPolicy.dailyRetentionDays, 1, 365);
    checkRange(errors, "retentionPolicy.weeklyRetentionWeeks", config.retentionPolicy.weeklyRetentionWeeks, 1, 104);
    checkRange(errors, "retentionPolicy.monthlyRetentionMonths", config.retentionPolicy.monthlyRetentionMonths, 1, 60);
    checkRange(errors, "retentionPolicy.maxBackups", config.retentionPolicy.maxBackups, 1, 1000);
    checkRange(errors, "defaultSchedule.retries", config.defaultSchedule.retries, 0, 10);
    checkRange(errors, "defaultSchedule.timeoutMinutes", config.defaultSchedule.timeoutMinutes, 1, 1440);
    checkSchedule(errors, config.defaultSchedule.cron, config.defaultSchedule.timezone);

    if (config.destinations.empty()) {
        errors.push_back("at least one destination is required");
    }
    for (const auto& destination : config.destinations) {
        if (std::find(kDestinationTypes.begin(), kDestinationTypes.end(), destination.type) ==
            kDestinationTypes.end()) {
            errors.push_back("unknown destination type: " + destination.type);
        }
        if (destination.path.empty()) {
            errors.push_back("destination path must not be empty");
        }
    }

    std::set<std::string> seen;
    for (const auto& storage : config.storageConfigs) {
        if (storage.type.empty()) {
            errors.push_back("storage config type must not be empty");
        } else if (!seen.insert(storage.type).second) {
            errors.push_back("duplicate storage config: " + storage.type);
        }
        if (!storage.scheduleCron.empty()) {
            checkSchedule(errors, storage.scheduleCron, config.defaultSchedule.timezone);
        }
    }

    if (!errors.empty()) {
        std::stringstream ss;
        ss << "Invalid backup configuration: ";
        for (size_t i = 0; i < errors.size(); ++i) {
            ss << (i ? "; " : "") << errors[i];
        }
        throw BackupError(BackupErrorCode::InvalidConfig, ss.str());
    }
}

void to_json(json& j, const BackupSchedule& s) {
    j = json{{"cron", s.cron}, {"timezone", s.timezone}, {"enabled", s.enabled},
             {"retries", s.retries}, {"timeout", s.timeoutMinutes}};
}

void from_json(const json& j, BackupSchedule& s) {
    BackupSchedule d;
    s.cron = j.value("cron", d.cron);
    s.timezone = j.value("timezone", d.timezone);
    s.enabled = j.value("enabled", d.enabled);
    s.retries = j.value("retries", d.retries);
    s.timeoutMinutes = j.value("timeout", d.timeoutMinutes);
}

void to_json(json& j, const RetentionPolicy& r) {
    j = json{{"dailyRetentionDays", r.dailyRetentionDays},
             {"weeklyRetentionWeeks", r.weeklyRetentionWeeks},
             {"monthlyRetentionMonths", r.monthlyRetentionMonths},
             {"maxBackups", r.maxBackups},
             {"autoCleanup", r.autoCleanup}};
}

void from_json(const json& j, RetentionPolicy& r) {
    RetentionPolicy d;
    r.dailyRetentionDays = j.value("dailyRetentionDays", d.dailyRetentionDays);
    r.weeklyRetentionWeeks = j.value("weeklyRetentionWeeks", d.weeklyRetentionWeeks);
    r.monthlyRetentionMonths = j.value("monthlyRetentionMonths", d.monthlyRetentionMonths);
    r.maxBackups = j.value("maxBackups", d.maxBackups);
    r.autoCleanup = j.value("autoCleanup", d.autoCleanup);
}

void to_json(json& j, const BackupDestination& d) {
    j = json{{"type", d.type}, {"path", d.path}, {"options", d.options}, {"encryption", d.encryption}};
}

void from_json(const json& j, BackupDestination& d) {
    d.type = j.value("type", "local");
    d.path = j.value("path", "");
    d.options = j.value("options", json::object());
    d.encryption = j.value("encryption", false);
}

void to_json(json& j, const StorageBackupConfig& s) {
    j = json{{"type", s.type},
             {"enabled", s.enabled},
             {"backupType", toString(s.backupType)},
             {"compression", toString(s.compression)},
             {"preBackupHooks", s.preBackupHooks},
             {"postBackupHooks", s.postBackupHooks},
             {"options", s.options}};
    if (!s.scheduleCron.empty()) {
        j["schedule"] = s.scheduleCron;
    }
}

void from_json(const json& j, StorageBackupConfig& s) {
    s.type = j.at("type").get<std::string>();
    s.enabled = j.value("enabled", true);
    s.backupType = parseBackupKind(j.value("backupType", "full"));
    s.compression = parseCompressionType(j.value("compression", "gzip"));
    s.preBackupHooks = j.value("preBackupHooks", std::vector<std::string>{});
    s.postBackupHooks = j.value("postBackupHooks", std::vector<std::string>{});
    s.options = j.value("options", json::object());
    s.scheduleCron = j.value("schedule", "");
}

void to_json(json& j, const GlobalSettings& g) {
    std::vector<std::string> types;
    for (auto type : g.verificationTypes) {
        types.push_back(toString(type));
    }
    j = json{{"maxParallelJobs", g.maxParallelJobs},
             {"enableVerification", g.enableVerification},
             {"verificationTypes", types},
             {"verificationTimeout", g.verificationTimeoutSeconds},
             {"parallelVerification", g.parallelVerification},
             {"customVerificationScripts", g.customVerificationScripts},
             {"scratchDirectory", g.scratchDirectory},
             {"reportDirectory", g.reportDirectory},
             {"catalogDirectory", g.catalogDirectory}};
}

void from_json(const json& j, GlobalSettings& g) {
    GlobalSettings d;
    g.maxParallelJobs = j.value("maxParallelJobs", d.maxParallelJobs);
    g.enableVerification = j.value("enableVerification", d.enableVerification);
    g.verificationTimeoutSeconds = j.value("verificationTimeout", d.verificationTimeoutSeconds);
    g.parallelVerification = j.value("parallelVerification", d.parallelVerification);
    g.customVerificationScripts = j.value("customVerificationScripts", d.customVerificationScripts);
    g.scratchDirectory = j.value("scratchDirectory", d.scratchDirectory);
    g.reportDirectory = j.value("reportDirectory", d.reportDirectory);
    g.catalogDirectory = j.value("catalogDirectory", d.catalogDirectory);
    g.verificationTypes.clear();
    if (j.contains("verificationTypes")) {
        for (const auto& type : j["verificationTypes"]) {
            g.verificationTypes.push_back(parseVerificationType(type.get<std::string>()));
        }
    } else {
        g.verificationTypes = d.verificationTypes;
    }
}

void to_json(json& j, const BackupConfig& c) {
    j = json{{"enabled", c.enabled},
             {"storageConfigs", c.storageConfigs},
             {"destinations", c.destinations},
             {"defaultSchedule", c.defaultSchedule},
             {"retentionPolicy", c.retentionPolicy},
             {"global", c.global}};
}

void from_json(const json& j, BackupConfig& c) {
    c.enabled = j.value("enabled", true);
    c.storageConfigs = j.value("storageConfigs", std::vector<StorageBackupConfig>{});
    c.destinations = j.value("destinations", std::vector<BackupDestination>{});
    c.defaultSchedule = j.value("defaultSchedule", BackupSchedule{});
    c.retentionPolicy = j.value("retentionPolicy", RetentionPolicy{});
    c.global = j.value("global", GlobalSettings{});
}
