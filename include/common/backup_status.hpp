#pragma once

#include <string>
#include <vector>
#include <optional>

enum class BackupStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

enum class BackupKind {
    Full,
    Incremental,
    Differential
};

enum class CompressionType {
    None,
    Gzip
};

enum class VerificationType {
    Checksum,
    SizeValidation,
    IntegrityCheck,
    RestoreTest
};

std::string toString(BackupStatus status);
std::string toString(BackupKind kind);
std::string toString(CompressionType compression);
std::string toString(VerificationType type);

// Parsers throw BackupError(InvalidConfig) on unknown names.
BackupStatus parseBackupStatus(const std::string& value);
BackupKind parseBackupKind(const std::string& value);
CompressionType parseCompressionType(const std::string& value);
VerificationType parseVerificationType(const std::string& value);

std::vector<VerificationType> parseVerificationTypes(const std::string& commaList);

inline bool isTerminal(BackupStatus status) {
    return status == BackupStatus::Completed ||
           status == BackupStatus::Failed ||
           status == BackupStatus::Cancelled;
}
