#include "backup/backup_catalog.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

BackupCatalog::BackupCatalog(std::string directory)
    : directory_(std::move(directory)) {
}

std::string BackupCatalog::pathFor(const std::string& backupId) const {
    return (fs::path(directory_) / (backupId + ".json")).string();
}

bool BackupCatalog::save(const BackupMetadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        Logger::error("Failed to create catalog directory " + directory_ + ": " + ec.message());
        return false;
    }

    std::string path = pathFor(metadata.id);
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            Logger::error("Failed to write catalog record " + tmp);
            return false;
        }
        out << nlohmann::json(metadata).dump(2) << std::endl;
        if (!out.good()) {
            Logger::error("Failed to write catalog record " + tmp);
            return false;
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        Logger::error("Failed to commit catalog record " + path + ": " + ec.message());
        return false;
    }
    return true;
}

bool BackupCatalog::remove(const std::string& backupId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(pathFor(backupId), ec);
    if (ec) {
        Logger::error("Failed to remove catalog record for " + backupId + ": " + ec.message());
        return false;
    }
    return true;
}

std::vector<BackupMetadata> BackupCatalog::loadAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackupMetadata> records;
    std::error_code ec;
    if (!fs::is_directory(directory_, ec)) {
        return records;
    }

    for (const auto& entry : fs::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }
        try {
            std::ifstream in(entry.path());
            records.push_back(nlohmann::json::parse(in).get<BackupMetadata>());
        } catch (const std::exception& e) {
            Logger::warning("Skipping unreadable catalog record " + entry.path().string() + ": " + e.what());
        }
    }

    std::sort(records.begin(), records.end(),
              [](const BackupMetadata& a, const BackupMetadata& b) { return a.startTime > b.startTime; });
    return records;
}
