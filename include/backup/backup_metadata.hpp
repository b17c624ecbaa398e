#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/backup_status.hpp"

using TimePoint = std::chrono::system_clock::time_point;

constexpr const char* kMetadataVersion = "1.0.0";

struct JobError {
    std::string message;
    std::string stack;
    std::string code;
};

struct BackupLocation {
    std::string type{"local"};
    std::string path;
};

struct VerificationSummary {
    VerificationType type{VerificationType::Checksum};
    bool passed{false};
    nlohmann::json details = nlohmann::json::object();
};

// Durable record of one backup's artifacts. Its id is the id of the job
// that produced it.
struct BackupMetadata {
    std::string id;
    std::string storageType;
    BackupKind backupType{BackupKind::Full};
    BackupStatus status{BackupStatus::Pending};
    TimePoint startTime{};
    std::optional<TimePoint> endTime;
    CompressionType compression{CompressionType::None};
    std::vector<std::string> files;
    std::map<std::string, std::string> checksums;   // file path -> sha256 hex
    uint64_t size{0};
    std::optional<uint64_t> compressedSize;
    BackupLocation destination;
    std::vector<std::string> tags;
    nlohmann::json sourceConfig = nlohmann::json::object();
    nlohmann::json metadata = nlohmann::json::object();
    std::string version{kMetadataVersion};
    std::optional<JobError> error;
    std::vector<VerificationSummary> verification;
};

struct RestoreOptions {
    std::string backupId;
    // Directory artifacts are staged in before being loaded
    std::string targetPath;
    // DATA-LOSS-CAPABLE. When true the backend drops or cleans the existing
    // target (for PostgreSQL: DROP DATABASE / pg_restore --clean) before
    // loading the backup. Always false unless a caller sets it explicitly.
    bool overwrite{false};
    // Restrict to these artifact files; empty means all
    std::vector<std::string> files;
    // Re-check checksums before restoring
    bool verify{false};
    nlohmann::json options = nlohmann::json::object();
};

enum class BackupSortField {
    StartTime,
    Size,
    StorageType
};

struct BackupSearchFilters {
    std::optional<std::string> storageType;
    std::optional<BackupStatus> status;
    std::optional<BackupKind> backupType;
    std::optional<TimePoint> startDate;
    std::optional<TimePoint> endDate;
    std::optional<uint64_t> minSize;
    std::optional<uint64_t> maxSize;
    std::vector<std::string> tags;
    BackupSortField sortBy{BackupSortField::StartTime};
    bool descending{true};
    size_t offset{0};
    size_t limit{100};
};

struct StorageTypeStatistics {
    size_t count{0};
    uint64_t totalSize{0};
    std::optional<TimePoint> lastBackup;
};

struct BackupStatistics {
    size_t totalBackups{0};
    size_t successfulBackups{0};
    size_t failedBackups{0};
    size_t cancelledBackups{0};
    size_t activeBackups{0};
    size_t queuedBackups{0};
    uint64_t totalSize{0};
    uint64_t averageSize{0};
    double successRate{0.0};   // percent of finished jobs that completed
    std::optional<TimePoint> lastBackupTime;
    std::optional<TimePoint> nextScheduledBackup;
    std::map<std::string, StorageTypeStatistics> storageTypeStats;
};

bool matchesFilters(const BackupMetadata& metadata, const BackupSearchFilters& filters);

void to_json(nlohmann::json& j, const JobError& e);
void from_json(const nlohmann::json& j, JobError& e);
void to_json(nlohmann::json& j, const BackupLocation& l);
void from_json(const nlohmann::json& j, BackupLocation& l);
void to_json(nlohmann::json& j, const VerificationSummary& v);
void from_json(const nlohmann::json& j, VerificationSummary& v);
void to_json(nlohmann::json& j, const BackupMetadata& m);
void from_json(const nlohmann::json& j, BackupMetadata& m);
void to_json(nlohmann::json& j, const BackupStatistics& s);
