#include "backup/backup_metadata.hpp"
#include "common/utils.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {

std::string timeToJson(TimePoint tp) {
    return utils::formatIsoTime(tp);
}

TimePoint timeFromJson(const json& value) {
    if (value.is_number_integer()) {
        return utils::fromMillis(value.get<int64_t>());
    }
    if (value.is_string()) {
        auto parsed = utils::parseIsoTime(value.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    return TimePoint{};
}

json optionalTime(const std::optional<TimePoint>& tp) {
    return tp ? json(timeToJson(*tp)) : json(nullptr);
}

} // namespace

bool matchesFilters(const BackupMetadata& metadata, const BackupSearchFilters& filters) {
    if (filters.storageType && metadata.storageType != *filters.storageType) {
        return false;
    }
    if (filters.status && metadata.status != *filters.status) {
        return false;
    }
    if (filters.backupType && metadata.backupType != *filters.backupType) {
        return false;
    }
    if (filters.startDate && metadata.startTime < *filters.startDate) {
        return false;
    }
    if (filters.endDate && metadata.startTime > *filters.endDate) {
        return false;
    }
    if (filters.minSize && metadata.size < *filters.minSize) {
        return false;
    }
    if (filters.maxSize && metadata.size > *filters.maxSize) {
        return false;
    }
    for (const auto& tag : filters.tags) {
        if (std::find(metadata.tags.begin(), metadata.tags.end(), tag) == metadata.tags.end()) {
            return false;
        }
    }
    return true;
}

void to_json(json& j, const JobError& e) {
    j = json{{"message", e.message}, {"code", e.code}};
    if (!e.stack.empty()) {
        j["stack"] = e.stack;
    }
}

void from_json(const json& j, JobError& e) {
    e.message = j.value("message", "");
    e.stack = j.value("stack", "");
    e.code = j.value("code", "");
}

void to_json(json& j, const BackupLocation& l) {
    j = json{{"type", l.type}, {"path", l.path}};
}

void from_json(const json& j, BackupLocation& l) {
    l.type = j.value("type", "local");
    l.path = j.value("path", "");
}

void to_json(json& j, const VerificationSummary& v) {
    j = json{{"type", toString(v.type)}, {"passed", v.passed}, {"details", v.details}};
}

void from_json(const json& j, VerificationSummary& v) {
    v.type = parseVerificationType(j.at("type").get<std::string>());
    v.passed = j.value("passed", false);
    v.details = j.value("details", json::object());
}

void to_json(json& j, const BackupMetadata& m) {
    j = json{
        {"id", m.id},
        {"storageType", m.storageType},
        {"backupType", toString(m.backupType)},
        {"status", toString(m.status)},
        {"startTime", timeToJson(m.startTime)},
        {"endTime", optionalTime(m.endTime)},
        {"compression", toString(m.compression)},
        {"files", m.files},
        {"checksums", m.checksums},
        {"size", m.size},
        {"destination", m.destination},
        {"tags", m.tags},
        {"sourceConfig", m.sourceConfig},
        {"metadata", m.metadata},
        {"version", m.version},
        {"verification", m.verification},
    };
    j["compressedSize"] = m.compressedSize ? json(*m.compressedSize) : json(nullptr);
    j["error"] = m.error ? json(*m.error) : json(nullptr);
}

void from_json(const json& j, BackupMetadata& m) {
    m.id = j.at("id").get<std::string>();
    m.storageType = j.at("storageType").get<std::string>();
    m.backupType = parseBackupKind(j.value("backupType", "full"));
    m.status = parseBackupStatus(j.value("status", "completed"));
    m.startTime = timeFromJson(j.value("startTime", json()));
    if (j.contains("endTime") && !j["endTime"].is_null()) {
        m.endTime = timeFromJson(j["endTime"]);
    }
    m.compression = parseCompressionType(j.value("compression", "none"));
    m.files = j.value("files", std::vector<std::string>{});
    m.checksums = j.value("checksums", std::map<std::string, std::string>{});
    m.size = j.value("size", uint64_t{0});
    if (j.contains("compressedSize") && !j["compressedSize"].is_null()) {
        m.compressedSize = j["compressedSize"].get<uint64_t>();
    }
    if (j.contains("destination")) {
        m.destination = j["destination"].get<BackupLocation>();
    }
    m.tags = j.value("tags", std::vector<std::string>{});
    m.sourceConfig = j.value("sourceConfig", json::object());
    m.metadata = j.value("metadata", json::object());
    m.version = j.value("version", std::string(kMetadataVersion));
    if (j.contains("error") && !j["error"].is_null()) {
        m.error = j["error"].get<JobError>();
    }
    if (j.contains("verification")) {
        m.verification = j["verification"].get<std::vector<VerificationSummary>>();
    }
}

void to_json(json& j, const BackupStatistics& s) {
    json byType = json::object();
    for (const auto& entry : s.storageTypeStats) {
        byType[entry.first] = {
            {"count", entry.second.count},
            {"totalSize", entry.second.totalSize},
            {"lastBackup", optionalTime(entry.second.lastBackup)},
        };
    }
    j = json{
        {"totalBackups", s.totalBackups},
        {"successfulBackups", s.successfulBackups},
        {"failedBackups", s.failedBackups},
        {"cancelledBackups", s.cancelledBackups},
        {"activeBackups", s.activeBackups},
        {"queuedBackups", s.queuedBackups},
        {"totalSize", s.totalSize},
        {"averageSize", s.averageSize},
        {"successRate", s.successRate},
        {"lastBackupTime", optionalTime(s.lastBackupTime)},
        {"nextScheduledBackup", optionalTime(s.nextScheduledBackup)},
        {"storageTypeStats", byType},
    };
}
