#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "backup/base_storage_backend.hpp"
#include "backup/postgres/pg_connection.hpp"

// Reference backend: logical dumps with pg_dump / pg_dumpall, restores with
// pg_restore or psql, probes and size estimates over libpq.
class PostgresBackend : public BaseStorageBackend {
public:
    static constexpr const char* kStorageType = "postgres";
    static constexpr std::chrono::hours kDumpTimeout{1};
    static constexpr std::chrono::minutes kAuxiliaryTimeout{5};
    static constexpr int kRestoreJobs = 4;

    // Without an explicit connection the environment is consulted on first use.
    explicit PostgresBackend(std::optional<PostgresConnectionConfig> connection = std::nullopt);
    ~PostgresBackend() override;

    bool isAvailable() override;
    nlohmann::json getStorageInfo() override;
    uint64_t getEstimatedSize() override;
    bool verifyBackup(const BackupMetadata& metadata, VerificationType type) override;
    void cleanup() override;

    // custom -> dump, tar -> tar, directory -> dir, plain -> sql
    static std::string formatExtension(const std::string& format);

    // Format from the artifact name (a trailing .gz is ignored). Unknown
    // extensions are sniffed: the "PGDMP" archive header means custom,
    // anything else plain.
    static std::string detectFormat(const std::string& path);

    // The primary dump among the artifacts, excluding schema/globals files.
    static std::optional<std::string> findMainBackupFile(const std::vector<std::string>& files);
    static std::optional<std::string> findGlobalsFile(const std::vector<std::string>& files);

    static std::vector<std::string> buildDumpArgs(const PostgresConnectionConfig& connection,
                                                  const nlohmann::json& options,
                                                  const std::string& outputFile);
    static std::vector<std::string> buildRestoreArgs(const PostgresConnectionConfig& connection,
                                                     const std::string& format,
                                                     const std::string& inputFile,
                                                     bool overwrite);
    static std::vector<std::string> buildPsqlArgs(const PostgresConnectionConfig& connection,
                                                  const std::string& database,
                                                  const std::string& inputFile,
                                                  bool stopOnError);

protected:
    std::vector<std::string> doCreateBackup(const StorageBackupConfig& config,
                                            const std::string& destinationDir,
                                            CancellationTokenPtr cancelToken) override;

    bool doRestoreBackup(const BackupMetadata& metadata,
                         const std::vector<std::string>& files,
                         const RestoreOptions& options,
                         CancellationTokenPtr cancelToken) override;

private:
    std::optional<PostgresConnectionConfig> connection();
    ProcessOptions toolOptions(const PostgresConnectionConfig& connection,
                               std::chrono::milliseconds timeout,
                               CancellationTokenPtr cancelToken) const;

    // Drops and recreates the target database after terminating every other
    // session connected to it. Destroys all data in that database.
    bool recreateDatabase(const PostgresConnectionConfig& connection);
    bool replayGlobals(const PostgresConnectionConfig& connection, const std::string& globalsFile,
                       CancellationTokenPtr cancelToken);
    bool checkArchiveReadable(const std::string& file, const std::string& format);

    std::optional<PostgresConnectionConfig> connection_;
    bool resolved_{false};
    std::mutex connectionMutex_;
};
