#include "common/backup_status.hpp"
#include "common/backup_error.hpp"
#include <sstream>
#include <algorithm>

std::string toString(BackupErrorCode code) {
    switch (code) {
        case BackupErrorCode::NotConfigured:       return "not-configured";
        case BackupErrorCode::NotEnabled:          return "not-enabled";
        case BackupErrorCode::NoHandler:           return "no-handler";
        case BackupErrorCode::Unavailable:         return "unavailable";
        case BackupErrorCode::ToolMissing:         return "tool-missing";
        case BackupErrorCode::NotFound:            return "not-found";
        case BackupErrorCode::VerificationFailed:  return "verification-failed";
        case BackupErrorCode::ExternalToolFailure: return "external-tool-failure";
        case BackupErrorCode::Timeout:             return "timeout";
        case BackupErrorCode::Cancelled:           return "cancelled";
        case BackupErrorCode::InvalidConfig:       return "invalid-config";
        case BackupErrorCode::ShuttingDown:        return "shutting-down";
        case BackupErrorCode::Internal:            return "internal";
    }
    return "internal";
}

std::string toString(BackupStatus status) {
    switch (status) {
        case BackupStatus::Pending:   return "pending";
        case BackupStatus::Running:   return "running";
        case BackupStatus::Completed: return "completed";
        case BackupStatus::Failed:    return "failed";
        case BackupStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

std::string toString(BackupKind kind) {
    switch (kind) {
        case BackupKind::Full:         return "full";
        case BackupKind::Incremental:  return "incremental";
        case BackupKind::Differential: return "differential";
    }
    return "full";
}

std::string toString(CompressionType compression) {
    return compression == CompressionType::Gzip ? "gzip" : "none";
}

std::string toString(VerificationType type) {
    switch (type) {
        case VerificationType::Checksum:       return "checksum";
        case VerificationType::SizeValidation: return "size-validation";
        case VerificationType::IntegrityCheck: return "integrity-check";
        case VerificationType::RestoreTest:    return "restore-test";
    }
    return "checksum";
}

BackupStatus parseBackupStatus(const std::string& value) {
    if (value == "pending") return BackupStatus::Pending;
    if (value == "running") return BackupStatus::Running;
    if (value == "completed") return BackupStatus::Completed;
    if (value == "failed") return BackupStatus::Failed;
    if (value == "cancelled") return BackupStatus::Cancelled;
    throw BackupError(BackupErrorCode::InvalidConfig, "Unknown backup status: " + value);
}

BackupKind parseBackupKind(const std::string& value) {
    if (value == "full") return BackupKind::Full;
    if (value == "incremental") return BackupKind::Incremental;
    if (value == "differential") return BackupKind::Differential;
    throw BackupError(BackupErrorCode::InvalidConfig, "Unknown backup type: " + value);
}

CompressionType parseCompressionType(const std::string& value) {
    if (value == "none" || value.empty()) return CompressionType::None;
    if (value == "gzip") return CompressionType::Gzip;
    throw BackupError(BackupErrorCode::InvalidConfig, "Unsupported compression: " + value);
}

VerificationType parseVerificationType(const std::string& value) {
    if (value == "checksum") return VerificationType::Checksum;
    if (value == "size-validation") return VerificationType::SizeValidation;
    if (value == "integrity-check") return VerificationType::IntegrityCheck;
    if (value == "restore-test") return VerificationType::RestoreTest;
    throw BackupError(BackupErrorCode::InvalidConfig, "Unknown verification type: " + value);
}

std::vector<VerificationType> parseVerificationTypes(const std::string& commaList) {
    std::vector<VerificationType> types;
    std::stringstream ss(commaList);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (item.empty()) {
            continue;
        }
        auto type = parseVerificationType(item);
        if (std::find(types.begin(), types.end(), type) == types.end()) {
            types.push_back(type);
        }
    }
    return types;
}
