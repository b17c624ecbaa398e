#include "backup/base_storage_backend.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "common/scoped_directory.hpp"
#include <zlib.h>
#include <filesystem>
#include <fstream>
#include <algorithm>
#include <optional>

namespace fs = std::filesystem;

BaseStorageBackend::BaseStorageBackend(std::string storageType)
    : storageType_(std::move(storageType)) {
}

std::string BaseStorageBackend::getLastError() const {
    std::lock_guard<std::mutex> lock(errorMutex_);
    return lastError_;
}

void BaseStorageBackend::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex_);
    lastError_ = error;
}

std::vector<std::string> BaseStorageBackend::createBackup(const StorageBackupConfig& config,
                                                          const std::string& destinationDir,
                                                          CancellationTokenPtr cancelToken) {
    fs::create_directories(destinationDir);

    std::vector<std::string> files = doCreateBackup(config, destinationDir, cancelToken);
    if (config.compression != CompressionType::Gzip) {
        return files;
    }

    std::vector<std::string> compressed;
    for (const auto& file : files) {
        if (cancelToken) {
            cancelToken->throwIfCancelled("Backup cancelled during compression");
        }
        if (!fs::is_regular_file(file)) {
            // Directory-format output is kept as-is
            compressed.push_back(file);
            continue;
        }

        std::string target = file + ".gz";
        if (!compressFile(file, target)) {
            throw BackupError(BackupErrorCode::Internal, "Failed to compress " + file);
        }
        std::error_code ec;
        fs::remove(file, ec);
        compressed.push_back(target);
        Logger::debug("Compressed " + file + " -> " + utils::formatBytes(utils::pathSize(target)));
    }
    return compressed;
}

bool BaseStorageBackend::restoreBackup(const BackupMetadata& metadata,
                                       const RestoreOptions& options,
                                       CancellationTokenPtr cancelToken) {
    std::vector<std::string> selected;
    for (const auto& file : metadata.files) {
        if (options.files.empty() ||
            std::find(options.files.begin(), options.files.end(), file) != options.files.end() ||
            std::find(options.files.begin(), options.files.end(), fs::path(file).filename().string()) !=
                options.files.end()) {
            selected.push_back(file);
        }
    }
    if (selected.empty()) {
        setLastError("No backup files selected for restore of " + metadata.id);
        Logger::error(getLastError());
        return false;
    }

    if (options.verify && !verifyChecksums(metadata)) {
        Logger::error("Refusing to restore " + metadata.id + ": " + getLastError());
        return false;
    }

    // Artifacts are expanded into targetPath, which the caller owns. Without
    // one a private directory is used and removed afterwards.
    std::optional<ScopedDirectory> privateDir;
    fs::path staging;
    if (options.targetPath.empty()) {
        privateDir.emplace(fs::temp_directory_path() / ("restore-" + metadata.id));
        staging = privateDir->path();
    } else {
        staging = options.targetPath;
    }
    fs::create_directories(staging);

    std::vector<std::string> files;
    for (const auto& file : selected) {
        if (!fs::exists(file)) {
            setLastError("Backup file not found: " + file);
            Logger::error(getLastError());
            return false;
        }
        if (utils::endsWith(file, ".gz")) {
            fs::path target = staging / fs::path(file).stem();
            if (!decompressFile(file, target.string())) {
                setLastError("Failed to decompress " + file);
                Logger::error(getLastError());
                return false;
            }
            files.push_back(target.string());
        } else if (!privateDir) {
            fs::path target = staging / fs::path(file).filename();
            std::error_code ec;
            if (fs::weakly_canonical(file, ec) != fs::weakly_canonical(target, ec)) {
                fs::copy(file, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
                if (ec) {
                    setLastError("Failed to stage " + file + ": " + ec.message());
                    Logger::error(getLastError());
                    return false;
                }
            }
            files.push_back(target.string());
        } else {
            files.push_back(file);
        }
    }

    return doRestoreBackup(metadata, files, options, cancelToken);
}

bool BaseStorageBackend::verifyBackup(const BackupMetadata& metadata, VerificationType type) {
    switch (type) {
        case VerificationType::Checksum:
            return verifyChecksums(metadata);
        case VerificationType::SizeValidation:
            return verifyFilesPresent(metadata);
        case VerificationType::IntegrityCheck:
            return verifyFilesPresent(metadata) && verifyChecksums(metadata);
        case VerificationType::RestoreTest: {
            ScopedDirectory scratch(fs::temp_directory_path() / ("verify-" + metadata.id));
            RestoreOptions options;
            options.backupId = metadata.id;
            options.targetPath = scratch.path().string();
            options.overwrite = true;
            options.verify = false;
            try {
                return restoreBackup(metadata, options, nullptr);
            } catch (const std::exception& e) {
                setLastError(std::string("Restore test failed: ") + e.what());
                Logger::error(getLastError());
                return false;
            }
        }
    }
    return false;
}

bool BaseStorageBackend::verifyChecksums(const BackupMetadata& metadata) {
    for (const auto& file : metadata.files) {
        auto expected = metadata.checksums.find(file);
        if (expected == metadata.checksums.end()) {
            setLastError("No checksum recorded for " + file);
            return false;
        }
        if (!fs::exists(file)) {
            setLastError("File not found: " + file);
            return false;
        }
        if (utils::sha256Path(file) != expected->second) {
            setLastError("Checksum mismatch: " + file);
            return false;
        }
    }
    return true;
}

bool BaseStorageBackend::verifyFilesPresent(const BackupMetadata& metadata) {
    for (const auto& file : metadata.files) {
        if (!fs::exists(file)) {
            setLastError("Missing file: " + file);
            return false;
        }
        if (utils::pathSize(file) == 0) {
            setLastError("Empty file: " + file);
            return false;
        }
    }
    return true;
}

ProcessResult BaseStorageBackend::runCommand(const std::string& program,
                                             const std::vector<std::string>& args,
                                             const ProcessOptions& options) {
    return ProcessRunner::runChecked(program, args, options);
}

std::map<std::string, std::string> BaseStorageBackend::calculateChecksums(const std::vector<std::string>& files) {
    std::map<std::string, std::string> checksums;
    for (const auto& file : files) {
        checksums[file] = utils::sha256Path(file);
    }
    return checksums;
}

bool BaseStorageBackend::compressFile(const std::string& source, const std::string& target, int level) {
    std::ifstream inFile(source, std::ios::binary);
    if (!inFile) {
        Logger::error("Failed to open file for compression: " + source);
        return false;
    }

    std::string mode = "wb" + std::to_string(level);
    gzFile outFile = gzopen(target.c_str(), mode.c_str());
    if (!outFile) {
        Logger::error("Failed to create compressed file: " + target);
        return false;
    }

    char buf[64 * 1024];
    bool ok = true;
    while (inFile) {
        inFile.read(buf, sizeof(buf));
        std::streamsize n = inFile.gcount();
        if (n > 0 && gzwrite(outFile, buf, static_cast<unsigned>(n)) != static_cast<int>(n)) {
            ok = false;
            break;
        }
    }

    if (gzclose(outFile) != Z_OK) {
        ok = false;
    }
    if (!ok) {
        Logger::error("Failed to write compressed file: " + target);
        std::error_code ec;
        fs::remove(target, ec);
    }
    return ok;
}

bool BaseStorageBackend::decompressFile(const std::string& source, const std::string& target) {
    gzFile inFile = gzopen(source.c_str(), "rb");
    if (!inFile) {
        Logger::error("Failed to open compressed file: " + source);
        return false;
    }

    std::ofstream outFile(target, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        gzclose(inFile);
        Logger::error("Failed to create file: " + target);
        return false;
    }

    char buf[64 * 1024];
    int n = 0;
    while ((n = gzread(inFile, buf, sizeof(buf))) > 0) {
        outFile.write(buf, n);
    }
    bool ok = n == 0 && outFile.good();
    gzclose(inFile);
    if (!ok) {
        Logger::error("Failed to decompress " + source);
    }
    return ok;
}
