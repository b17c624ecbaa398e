#include "backup/backup_cli.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_manager.hpp"
#include "backup/postgres/postgres_backend.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::string configPath = utils::getEnvOr("BACKUP_CONFIG_FILE", "");
    std::string logPath = utils::getEnvOr("BACKUP_LOG_FILE", "/tmp/unibackup.log");
    LogLevel logLevel = Logger::parseLevel(utils::getEnvOr("BACKUP_LOG_LEVEL", "info"));
    std::vector<std::string> args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            BackupCLI::printUsage();
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "unibackup version 1.0.0\n";
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            logPath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = Logger::parseLevel(argv[++i]);
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        std::cerr << "Error: No command specified" << std::endl;
        BackupCLI::printUsage();
        return 1;
    }

    if (!Logger::initialize(logPath, logLevel)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    int exitCode = 1;
    try {
        BackupConfig config = configPath.empty() ? createDefaultBackupConfig()
                                                 : loadBackupConfig(configPath);

        auto manager = std::make_shared<BackupManager>(config);
        if (config.findStorageConfig(PostgresBackend::kStorageType)) {
            manager->registerBackend(std::make_shared<PostgresBackend>());
        }

        BackupCLI cli(manager);
        exitCode = cli.run(args);
        manager->shutdown();
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        Logger::error("Error in main: " + std::string(e.what()));
        exitCode = 1;
    }

    Logger::shutdown();
    return exitCode;
}
