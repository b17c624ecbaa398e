#include "backup/postgres/postgres_backend.hpp"
#include "common/backup_error.hpp"
#include "common/logger.hpp"
#include "common/scoped_directory.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const char* kAdminDatabase = "postgres";
const char* kMainArtifact = "postgres_backup";
const char* kSchemaArtifact = "postgres_schema.sql";
const char* kGlobalsArtifact = "postgres_globals.sql";

std::string stripGz(const std::string& name) {
    return utils::endsWith(name, ".gz") ? name.substr(0, name.size() - 3) : name;
}

} // namespace

PostgresBackend::PostgresBackend(std::optional<PostgresConnectionConfig> connection)
    : BaseStorageBackend(kStorageType)
    , connection_(std::move(connection))
    , resolved_(connection_.has_value()) {
}

PostgresBackend::~PostgresBackend() {
    cleanup();
}

std::optional<PostgresConnectionConfig> PostgresBackend::connection() {
    std::lock_guard<std::mutex> lock(connectionMutex_);
    if (!resolved_) {
        connection_ = PostgresConnectionConfig::fromEnvironment();
        resolved_ = true;
        if (connection_) {
            Logger::info("PostgreSQL backend configured for " + connection_->host + ":" +
                         std::to_string(connection_->port) + "/" + connection_->database);
        } else {
            Logger::warning("PostgreSQL backend not configured");
        }
    }
    return connection_;
}

ProcessOptions PostgresBackend::toolOptions(const PostgresConnectionConfig& connection,
                                            std::chrono::milliseconds timeout,
                                            CancellationTokenPtr cancelToken) const {
    ProcessOptions options;
    options.timeout = timeout;
    options.cancelToken = std::move(cancelToken);
    // The password only reaches the child environment, never the command line
    if (!connection.password.empty()) {
        options.env["PGPASSWORD"] = connection.password;
    }
    if (connection.ssl) {
        options.env["PGSSLMODE"] = "require";
    }
    return options;
}

bool PostgresBackend::isAvailable() {
    auto conn = connection();
    if (!conn) {
        setLastError("PostgreSQL connection not configured");
        return false;
    }

    PgConnection pg(conn->conninfo());
    if (!pg.isOpen()) {
        setLastError(pg.getLastError());
        Logger::warning("PostgreSQL not available: " + pg.getLastError());
        return false;
    }
    if (!pg.queryScalar("SELECT 1")) {
        setLastError(pg.getLastError());
        Logger::warning("PostgreSQL probe failed: " + pg.getLastError());
        return false;
    }
    return true;
}

uint64_t PostgresBackend::getEstimatedSize() {
    auto conn = connection();
    if (!conn) {
        return 0;
    }

    PgConnection pg(conn->conninfo());
    auto size = pg.queryScalar("SELECT pg_database_size(current_database())");
    if (!size) {
        Logger::warning("Failed to estimate PostgreSQL database size: " + pg.getLastError());
        return 0;
    }
    try {
        return std::stoull(*size);
    } catch (const std::exception& e) {
        Logger::warning(std::string("Unexpected database size value: ") + e.what());
        return 0;
    }
}

json PostgresBackend::getStorageInfo() {
    auto conn = connection();
    if (!conn) {
        return json{{"type", kStorageType}, {"error", "PostgreSQL connection not configured"}};
    }

    PgConnection pg(conn->conninfo());
    if (!pg.isOpen()) {
        return json{{"type", kStorageType}, {"error", pg.getLastError()}};
    }

    json info{
        {"type", kStorageType},
        {"host", conn->host},
        {"port", conn->port},
        {"database", conn->database},
        {"ssl", conn->ssl},
        {"serverVersion", pg.serverVersion()},
    };
    info["version"] = pg.queryScalar("SELECT version()").value_or("");

    auto size = pg.queryScalar("SELECT pg_database_size(current_database())");
    info["size"] = size ? std::stoull(*size) : 0ULL;

    auto tables = pg.queryScalar(
        "SELECT count(*) FROM information_schema.tables "
        "WHERE table_schema NOT IN ('pg_catalog', 'information_schema')");
    info["tableCount"] = tables ? std::stoi(*tables) : 0;

    info["schemas"] = pg.queryColumn(
        "SELECT schema_name FROM information_schema.schemata "
        "WHERE schema_name NOT LIKE 'pg_%' AND schema_name <> 'information_schema' "
        "ORDER BY schema_name");
    return info;
}

std::string PostgresBackend::formatExtension(const std::string& format) {
    if (format == "custom") return "dump";
    if (format == "tar") return "tar";
    if (format == "directory") return "dir";
    if (format == "plain") return "sql";
    throw BackupError(BackupErrorCode::InvalidConfig, "Unsupported pg_dump format: " + format);
}

std::string PostgresBackend::detectFormat(const std::string& path) {
    std::string name = stripGz(fs::path(path).filename().string());
    std::string ext = fs::path(name).extension().string();
    if (ext == ".dump") return "custom";
    if (ext == ".tar") return "tar";
    if (ext == ".dir") return "directory";
    if (ext == ".sql") return "plain";

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return "directory";
    }

    std::ifstream in(path, std::ios::binary);
    char magic[5] = {0, 0, 0, 0, 0};
    if (in.read(magic, sizeof(magic)) && std::string(magic, sizeof(magic)) == "PGDMP") {
        Logger::warning("Unrecognized extension on " + path + ", archive header says custom format");
        return "custom";
    }
    if (in.is_open()) {
        Logger::warning("Unrecognized extension on " + path + ", treating as plain SQL");
        return "plain";
    }
    Logger::warning("Cannot inspect " + path + ", assuming custom format");
    return "custom";
}

std::optional<std::string> PostgresBackend::findMainBackupFile(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        std::string name = fs::path(file).filename().string();
        if (name.find(kMainArtifact) != std::string::npos &&
            name.find("schema") == std::string::npos &&
            name.find("globals") == std::string::npos) {
            return file;
        }
    }
    return std::nullopt;
}

std::optional<std::string> PostgresBackend::findGlobalsFile(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        if (stripGz(fs::path(file).filename().string()) == kGlobalsArtifact) {
            return file;
        }
    }
    return std::nullopt;
}

std::vector<std::string> PostgresBackend::buildDumpArgs(const PostgresConnectionConfig& connection,
                                                        const json& options,
                                                        const std::string& outputFile) {
    std::string format = options.value("format", "custom");
    std::vector<std::string> args = {
        "--host", connection.host,
        "--port", std::to_string(connection.port),
        "--username", connection.user,
        "--dbname", connection.database,
        "--format", format,
        "--file", outputFile,
        "--verbose",
        "--no-password",
    };

    if (!options.value("includeData", true)) {
        args.push_back("--schema-only");
    }
    if (options.contains("excludeTables") && options["excludeTables"].is_array()) {
        for (const auto& table : options["excludeTables"]) {
            args.push_back("--exclude-table");
            args.push_back(table.get<std::string>());
        }
    }
    if (options.contains("compressLevel") && (format == "custom" || format == "directory")) {
        args.push_back("--compress");
        args.push_back(std::to_string(options["compressLevel"].get<int>()));
    }
    if (options.contains("jobs") && format == "directory") {
        args.push_back("--jobs");
        args.push_back(std::to_string(options["jobs"].get<int>()));
    }
    return args;
}

std::vector<std::string> PostgresBackend::buildRestoreArgs(const PostgresConnectionConfig& connection,
                                                           const std::string& format,
                                                           const std::string& inputFile,
                                                           bool overwrite) {
    std::vector<std::string> args = {
        "--host", connection.host,
        "--port", std::to_string(connection.port),
        "--username", connection.user,
        "--dbname", connection.database,
        "--verbose",
        "--no-password",
    };
    if (overwrite) {
        args.push_back("--clean");
        args.push_back("--if-exists");
    }
    if (format == "custom" || format == "directory") {
        args.push_back("--jobs");
        args.push_back(std::to_string(kRestoreJobs));
    }
    args.push_back(inputFile);
    return args;
}

std::vector<std::string> PostgresBackend::buildPsqlArgs(const PostgresConnectionConfig& connection,
                                                        const std::string& database,
                                                        const std::string& inputFile,
                                                        bool stopOnError) {
    std::vector<std::string> args = {
        "--host", connection.host,
        "--port", std::to_string(connection.port),
        "--username", connection.user,
        "--dbname", database,
        "--no-password",
        "--quiet",
        "--file", inputFile,
    };
    if (stopOnError) {
        args.push_back("--set");
        args.push_back("ON_ERROR_STOP=1");
    }
    return args;
}

std::vector<std::string> PostgresBackend::doCreateBackup(const StorageBackupConfig& config,
                                                         const std::string& destinationDir,
                                                         CancellationTokenPtr cancelToken) {
    auto conn = connection();
    if (!conn) {
        throw BackupError(BackupErrorCode::NotConfigured, "PostgreSQL connection not configured");
    }
    if (!ProcessRunner::isCommandAvailable("pg_dump")) {
        throw BackupError(BackupErrorCode::ToolMissing,
                          "pg_dump command not found. Please install PostgreSQL client tools.");
    }

    json options = defaultStorageOptions(kStorageType);
    options.merge_patch(config.options);
    std::string format = options.value("format", "custom");

    fs::path mainFile = fs::path(destinationDir) / (std::string(kMainArtifact) + "." + formatExtension(format));

    // Replace output from an earlier attempt
    std::error_code ec;
    for (const auto& stale : {mainFile, fs::path(mainFile.string() + ".gz"),
                              fs::path(destinationDir) / kSchemaArtifact,
                              fs::path(destinationDir) / kGlobalsArtifact}) {
        fs::remove_all(stale, ec);
    }

    std::vector<std::string> files;
    Logger::info("Starting pg_dump of " + conn->database + " (" + format + " format)");
    runCommand("pg_dump", buildDumpArgs(*conn, options, mainFile.string()),
               toolOptions(*conn, kDumpTimeout, cancelToken));
    files.push_back(mainFile.string());

    if (options.value("includeSchemaOnly", false)) {
        fs::path schemaFile = fs::path(destinationDir) / kSchemaArtifact;
        json schemaOptions = options;
        schemaOptions["format"] = "plain";
        schemaOptions["includeData"] = false;
        schemaOptions.erase("compressLevel");
        schemaOptions.erase("jobs");
        runCommand("pg_dump", buildDumpArgs(*conn, schemaOptions, schemaFile.string()),
                   toolOptions(*conn, kAuxiliaryTimeout, cancelToken));
        files.push_back(schemaFile.string());
    }

    if (options.value("includeGlobals", false)) {
        if (ProcessRunner::isCommandAvailable("pg_dumpall")) {
            fs::path globalsFile = fs::path(destinationDir) / kGlobalsArtifact;
            runCommand("pg_dumpall",
                       {"--host", conn->host, "--port", std::to_string(conn->port),
                        "--username", conn->user, "--globals-only", "--no-password",
                        "--file", globalsFile.string()},
                       toolOptions(*conn, kAuxiliaryTimeout, cancelToken));
            files.push_back(globalsFile.string());
        } else {
            Logger::warning("pg_dumpall not found, skipping globals backup");
        }
    }

    Logger::info("pg_dump finished: " + std::to_string(files.size()) + " artifact(s), " +
                 utils::formatBytes(utils::pathSize(mainFile.string())));
    return files;
}

bool PostgresBackend::doRestoreBackup(const BackupMetadata& metadata,
                                      const std::vector<std::string>& files,
                                      const RestoreOptions& options,
                                      CancellationTokenPtr cancelToken) {
    auto conn = connection();
    if (!conn) {
        setLastError("PostgreSQL connection not configured");
        Logger::error(getLastError());
        return false;
    }

    auto mainFile = findMainBackupFile(files);
    if (!mainFile) {
        setLastError("No suitable PostgreSQL backup file found in " + metadata.id);
        Logger::error(getLastError());
        return false;
    }

    std::string format = detectFormat(*mainFile);
    Logger::info("Restoring " + metadata.id + " into " + conn->database + " (" + format +
                 " format" + (options.overwrite ? ", overwrite" : "") + ")");

    try {
        if (format == "plain") {
            if (!ProcessRunner::isCommandAvailable("psql")) {
                throw BackupError(BackupErrorCode::ToolMissing,
                                  "psql command not found. Please install PostgreSQL client tools.");
            }
            if (options.overwrite && !recreateDatabase(*conn)) {
                return false;
            }
            runCommand("psql", buildPsqlArgs(*conn, conn->database, *mainFile, true),
                       toolOptions(*conn, kDumpTimeout, cancelToken));
        } else {
            if (!ProcessRunner::isCommandAvailable("pg_restore")) {
                throw BackupError(BackupErrorCode::ToolMissing,
                                  "pg_restore command not found. Please install PostgreSQL client tools.");
            }
            runCommand("pg_restore", buildRestoreArgs(*conn, format, *mainFile, options.overwrite),
                       toolOptions(*conn, kDumpTimeout, cancelToken));
        }

        auto globals = findGlobalsFile(files);
        if (globals && !replayGlobals(*conn, *globals, cancelToken)) {
            Logger::warning("Globals replay reported errors for " + metadata.id);
        }
    } catch (const BackupError& e) {
        setLastError(std::string("PostgreSQL restore failed: ") + e.what());
        Logger::error(getLastError());
        if (e.code() == BackupErrorCode::Cancelled) {
            throw;
        }
        return false;
    }

    Logger::info("Restore of " + metadata.id + " completed");
    return true;
}

bool PostgresBackend::recreateDatabase(const PostgresConnectionConfig& connection) {
    if (connection.database == kAdminDatabase) {
        setLastError("Refusing to drop the administrative database");
        Logger::error(getLastError());
        return false;
    }

    PgConnection admin(connection.conninfo(kAdminDatabase));
    if (!admin.isOpen()) {
        setLastError("Cannot connect to administrative database: " + admin.getLastError());
        Logger::error(getLastError());
        return false;
    }

    Logger::warning("Dropping and recreating database " + connection.database);
    // All other sessions must be gone before DROP DATABASE
    if (!admin.execute("SELECT pg_terminate_backend(pid) FROM pg_stat_activity "
                       "WHERE datname = $1 AND pid <> pg_backend_pid()",
                       {connection.database})) {
        setLastError("Failed to terminate sessions: " + admin.getLastError());
        Logger::error(getLastError());
        return false;
    }

    std::string name = admin.quoteIdentifier(connection.database);
    if (name.empty() ||
        !admin.execute("DROP DATABASE IF EXISTS " + name) ||
        !admin.execute("CREATE DATABASE " + name)) {
        setLastError("Failed to recreate database " + connection.database + ": " + admin.getLastError());
        Logger::error(getLastError());
        return false;
    }
    return true;
}

bool PostgresBackend::replayGlobals(const PostgresConnectionConfig& connection,
                                    const std::string& globalsFile,
                                    CancellationTokenPtr cancelToken) {
    Logger::info("Replaying globals from " + globalsFile);
    ProcessResult result = ProcessRunner::run(
        "psql", buildPsqlArgs(connection, kAdminDatabase, globalsFile, false),
        toolOptions(connection, kAuxiliaryTimeout, cancelToken));
    if (result.cancelled) {
        throw BackupError(BackupErrorCode::Cancelled, "Globals replay cancelled");
    }
    if (!result.success()) {
        Logger::warning("psql globals replay: " + utils::trim(result.stderrText));
        return false;
    }
    return true;
}

bool PostgresBackend::checkArchiveReadable(const std::string& file, const std::string& format) {
    if (format == "plain" || format == "directory") {
        return true;
    }
    if (!ProcessRunner::isCommandAvailable("pg_restore")) {
        Logger::warning("pg_restore not found, skipping archive listing check");
        return true;
    }

    std::optional<ScopedDirectory> expanded;
    std::string archive = file;
    if (utils::endsWith(file, ".gz")) {
        expanded.emplace(fs::temp_directory_path() / ("pg-verify-" + utils::generateId("x")));
        archive = (expanded->path() / fs::path(file).stem()).string();
        if (!decompressFile(file, archive)) {
            setLastError("Failed to decompress " + file);
            return false;
        }
    }

    ProcessOptions options;
    options.timeout = kAuxiliaryTimeout;
    ProcessResult result = ProcessRunner::run("pg_restore", {"--list", archive}, options);
    if (!result.success()) {
        setLastError("pg_restore cannot read archive " + file + ": " + utils::trim(result.stderrText));
        return false;
    }
    return true;
}

bool PostgresBackend::verifyBackup(const BackupMetadata& metadata, VerificationType type) {
    if (type != VerificationType::IntegrityCheck) {
        return BaseStorageBackend::verifyBackup(metadata, type);
    }

    if (!BaseStorageBackend::verifyBackup(metadata, VerificationType::IntegrityCheck)) {
        Logger::error("Integrity check failed for " + metadata.id + ": " + getLastError());
        return false;
    }

    auto mainFile = findMainBackupFile(metadata.files);
    if (!mainFile) {
        setLastError("No suitable PostgreSQL backup file found in " + metadata.id);
        return false;
    }
    try {
        if (!checkArchiveReadable(*mainFile, detectFormat(*mainFile))) {
            Logger::error(getLastError());
            return false;
        }
    } catch (const BackupError& e) {
        setLastError(e.what());
        Logger::error(getLastError());
        return false;
    }

    if (!isAvailable()) {
        Logger::error("Integrity check for " + metadata.id + " could not reach the database");
        return false;
    }
    return true;
}

void PostgresBackend::cleanup() {
    // Connections are per call; nothing is pooled
    Logger::debug("PostgreSQL backend cleanup");
}
