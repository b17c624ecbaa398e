#include "backup/destination_handler.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

std::string LocalDestinationHandler::backupDirectory(const BackupDestination& destination,
                                                     const BackupMetadata& metadata) {
    return (fs::path(destination.path) / metadata.storageType / metadata.id).string();
}

std::vector<std::string> LocalDestinationHandler::upload(const std::vector<std::string>& files,
                                                         const BackupDestination& destination,
                                                         const BackupMetadata& metadata) {
    fs::path target = backupDirectory(destination, metadata);
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        throw BackupError(BackupErrorCode::Internal,
                          "Failed to create " + target.string() + ": " + ec.message());
    }

    std::vector<std::string> stored;
    for (const auto& file : files) {
        fs::path dest = target / fs::path(file).filename();
        if (fs::weakly_canonical(file, ec) == fs::weakly_canonical(dest, ec)) {
            stored.push_back(dest.string());
            continue;
        }

        fs::remove_all(dest, ec);
        fs::copy(file, dest, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw BackupError(BackupErrorCode::Internal,
                              "Failed to copy " + file + " to " + dest.string() + ": " + ec.message());
        }
        stored.push_back(dest.string());
    }

    Logger::info("Stored " + std::to_string(stored.size()) + " file(s) for " + metadata.id +
                 " in " + target.string());
    return stored;
}

bool LocalDestinationHandler::writeMetadata(const BackupMetadata& metadata,
                                            const BackupDestination& destination) {
    fs::path target = fs::path(backupDirectory(destination, metadata)) / "metadata.json";
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);

    std::ofstream out(target);
    if (!out.is_open()) {
        Logger::error("Failed to write " + target.string());
        return false;
    }
    out << nlohmann::json(metadata).dump(2) << std::endl;
    return out.good();
}

bool LocalDestinationHandler::remove(const BackupMetadata& metadata,
                                     const BackupDestination& destination) {
    fs::path target = backupDirectory(destination, metadata);
    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec) {
        Logger::error("Failed to remove " + target.string() + ": " + ec.message());
        return false;
    }
    Logger::info("Removed backup directory " + target.string());
    return true;
}
