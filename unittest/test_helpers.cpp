#include "test_helpers.hpp"
#include "common/backup_error.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

FakeBackend::FakeBackend(const std::string& storageType)
    : BaseStorageBackend(storageType) {
}

nlohmann::json FakeBackend::getStorageInfo() {
    return nlohmann::json{{"type", storageType_}, {"size", payload.size()}};
}

bool FakeBackend::verifyBackup(const BackupMetadata& metadata, VerificationType type) {
    if (type == VerificationType::IntegrityCheck && failIntegrity) {
        setLastError("fake archive is corrupt");
        return false;
    }
    return BaseStorageBackend::verifyBackup(metadata, type);
}

std::vector<std::string> FakeBackend::doCreateBackup(const StorageBackupConfig&,
                                                     const std::string& destinationDir,
                                                     CancellationTokenPtr cancelToken) {
    ++createCalls;
    while (hold) {
        if (cancelToken) {
            cancelToken->throwIfCancelled("Fake backup cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (failCreate) {
        throw ProcessError("fake_dump exited with code 2", 2, "", "connection refused");
    }

    fs::path artifact = fs::path(destinationDir) / (storageType_ + "_backup.dat");
    writeFile(artifact, payload);
    return {artifact.string()};
}

bool FakeBackend::doRestoreBackup(const BackupMetadata&,
                                  const std::vector<std::string>& files,
                                  const RestoreOptions&,
                                  CancellationTokenPtr) {
    ++restoreCalls;
    if (throwOnRestore) {
        throw BackupError(BackupErrorCode::ExternalToolFailure, "fake_restore crashed");
    }
    {
        std::lock_guard<std::mutex> lock(restoredMutex_);
        restoredFiles_ = files;
    }
    if (!restoreResult) {
        setLastError("fake restore rejected the archive");
        return false;
    }
    return true;
}

std::vector<std::string> FakeBackend::lastRestoredFiles() const {
    std::lock_guard<std::mutex> lock(restoredMutex_);
    return restoredFiles_;
}

void RecordingMetrics::incrementCounter(const std::string& name, const MetricLabels&) {
    if (throwOnRecord) {
        throw std::runtime_error("metrics backend down");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[name];
}

void RecordingMetrics::recordHistogram(const std::string& name, double value, const MetricLabels&) {
    if (throwOnRecord) {
        throw std::runtime_error("metrics backend down");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    histograms_[name].push_back(value);
}

int RecordingMetrics::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it != counters_.end() ? it->second : 0;
}

std::vector<double> RecordingMetrics::histogram(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return it != histograms_.end() ? it->second : std::vector<double>{};
}

std::unique_ptr<ScopedDirectory> makeTempDir(const std::string& prefix) {
    return std::make_unique<ScopedDirectory>(fs::temp_directory_path() / utils::generateId(prefix));
}

BackupConfig makeTestConfig(const fs::path& baseDir, const std::string& storageType) {
    BackupConfig config;
    config.enabled = true;

    StorageBackupConfig storage;
    storage.type = storageType;
    storage.enabled = true;
    storage.compression = CompressionType::None;
    config.storageConfigs.push_back(storage);

    BackupDestination destination;
    destination.type = "local";
    destination.path = (baseDir / "dest").string();
    config.destinations.push_back(destination);

    config.defaultSchedule.enabled = false;
    config.defaultSchedule.retries = 0;

    config.global.maxParallelJobs = 3;
    config.global.enableVerification = true;
    config.global.verificationTypes = {VerificationType::Checksum, VerificationType::SizeValidation};
    config.global.scratchDirectory = (baseDir / "scratch").string();
    config.global.reportDirectory = (baseDir / "reports").string();
    config.global.catalogDirectory = (baseDir / "catalog").string();
    return config;
}

void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

