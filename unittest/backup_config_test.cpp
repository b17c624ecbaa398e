#include <gtest/gtest.h>
#include "backup/backup_config.hpp"
#include "common/backup_error.hpp"
#include "test_helpers.hpp"
#include <cstdlib>

class BackupConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("config-test");
        config_ = makeTestConfig(tempDir_->path(), "postgres");
    }

    void TearDown() override {
        for (const auto& name : envSet_) {
            unsetenv(name.c_str());
        }
        tempDir_.reset();
    }

    void setEnv(const std::string& name, const std::string& value) {
        setenv(name.c_str(), value.c_str(), 1);
        envSet_.push_back(name);
    }

    static std::string validationMessage(const BackupConfig& config) {
        try {
            validateBackupConfig(config);
        } catch (const BackupError& e) {
            EXPECT_EQ(e.code(), BackupErrorCode::InvalidConfig);
            return e.what();
        }
        return "";
    }

    std::unique_ptr<ScopedDirectory> tempDir_;
    BackupConfig config_;
    std::vector<std::string> envSet_;
};

TEST_F(BackupConfigTest, TestConfigIsValid) {
    EXPECT_NO_THROW(validateBackupConfig(config_));
}

TEST_F(BackupConfigTest, ParallelJobsMustBeInRange) {
    config_.global.maxParallelJobs = 0;
    EXPECT_NE(validationMessage(config_).find("global.maxParallelJobs"), std::string::npos);
    config_.global.maxParallelJobs = 11;
    EXPECT_NE(validationMessage(config_).find("global.maxParallelJobs"), std::string::npos);
    config_.global.maxParallelJobs = 10;
    EXPECT_EQ(validationMessage(config_), "");
}

TEST_F(BackupConfigTest, RetentionAndScheduleRanges) {
    config_.retentionPolicy.dailyRetentionDays = 366;
    config_.retentionPolicy.maxBackups = 0;
    config_.defaultSchedule.retries = 11;
    std::string message = validationMessage(config_);
    EXPECT_NE(message.find("retentionPolicy.dailyRetentionDays"), std::string::npos);
    EXPECT_NE(message.find("retentionPolicy.maxBackups"), std::string::npos);
    EXPECT_NE(message.find("defaultSchedule.retries"), std::string::npos);
}

TEST_F(BackupConfigTest, CronAndTimezoneAreChecked) {
    config_.defaultSchedule.cron = "not a cron";
    config_.defaultSchedule.timezone = "Mars/Olympus";
    config_.storageConfigs.front().scheduleCron = "99 * * * *";
    std::string message = validationMessage(config_);
    EXPECT_NE(message.find("invalid cron expression: not a cron"), std::string::npos);
    EXPECT_NE(message.find("invalid cron expression: 99 * * * *"), std::string::npos);
    EXPECT_NE(message.find("unsupported timezone: Mars/Olympus"), std::string::npos);
}

TEST_F(BackupConfigTest, DestinationsAndStorageTypesAreChecked) {
    config_.destinations.front().type = "tape";
    config_.storageConfigs.push_back(config_.storageConfigs.front());
    std::string message = validationMessage(config_);
    EXPECT_NE(message.find("unknown destination type: tape"), std::string::npos);
    EXPECT_NE(message.find("duplicate storage config: postgres"), std::string::npos);

    config_ = makeTestConfig(tempDir_->path(), "postgres");
    config_.destinations.clear();
    EXPECT_NE(validationMessage(config_).find("at least one destination"), std::string::npos);
}

TEST_F(BackupConfigTest, MergeOverlaysScalarsAndStorageConfigs) {
    nlohmann::json overrides = {
        {"global", {{"maxParallelJobs", 5}}},
        {"retentionPolicy", {{"maxBackups", 20}}},
        {"storageConfigs", {
            {{"type", "postgres"}, {"compression", "none"}, {"options", {{"format", "plain"}}}},
            {{"type", "mysql"}, {"enabled", false}},
        }},
    };
    BackupConfig merged = mergeBackupConfig(config_, overrides);

    EXPECT_EQ(merged.global.maxParallelJobs, 5);
    EXPECT_EQ(merged.global.scratchDirectory, config_.global.scratchDirectory);
    EXPECT_EQ(merged.retentionPolicy.maxBackups, 20);
    EXPECT_EQ(merged.retentionPolicy.dailyRetentionDays, config_.retentionPolicy.dailyRetentionDays);

    ASSERT_EQ(merged.storageConfigs.size(), 2u);
    const StorageBackupConfig* postgres = merged.findStorageConfig("postgres");
    ASSERT_NE(postgres, nullptr);
    EXPECT_EQ(postgres->compression, CompressionType::None);
    EXPECT_EQ(postgres->options["format"], "plain");
    const StorageBackupConfig* mysql = merged.findStorageConfig("mysql");
    ASSERT_NE(mysql, nullptr);
    EXPECT_FALSE(mysql->enabled);

    EXPECT_EQ(merged.destinations.size(), 1u);
}

TEST_F(BackupConfigTest, DestinationsReplaceList) {
    nlohmann::json overrides = {
        {"destinations", {{{"type", "local"}, {"path", "/srv/a"}}, {{"type", "sftp"}, {"path", "/srv/b"}}}},
    };
    BackupConfig merged = mergeBackupConfig(config_, overrides);
    ASSERT_EQ(merged.destinations.size(), 2u);
    EXPECT_EQ(merged.destinations[1].type, "sftp");
}

TEST_F(BackupConfigTest, JsonRoundTripKeepsScheduleTimeout) {
    config_.defaultSchedule.timeoutMinutes = 90;
    nlohmann::json j = config_;
    EXPECT_EQ(j["defaultSchedule"]["timeout"], 90);
    BackupConfig back = j.get<BackupConfig>();
    EXPECT_EQ(back.defaultSchedule.timeoutMinutes, 90);
}

TEST_F(BackupConfigTest, VerificationScriptsComeFromGlobalSettings) {
    nlohmann::json overrides = {
        {"global", {{"parallelVerification", false},
                    {"customVerificationScripts", {{"postgres", {"/opt/checks/pg_check.sh"}}}}}},
    };
    BackupConfig merged = mergeBackupConfig(config_, overrides);
    EXPECT_FALSE(merged.global.parallelVerification);
    ASSERT_EQ(merged.global.customVerificationScripts.count("postgres"), 1u);
    EXPECT_EQ(merged.global.customVerificationScripts.at("postgres"),
              std::vector<std::string>{"/opt/checks/pg_check.sh"});

    nlohmann::json j = merged;
    EXPECT_EQ(j["global"]["customVerificationScripts"]["postgres"][0], "/opt/checks/pg_check.sh");
    EXPECT_FALSE(j["global"]["parallelVerification"].get<bool>());
}

TEST_F(BackupConfigTest, EnvironmentProvidesDefaults) {
    setEnv("BACKUP_MAX_PARALLEL_JOBS", "7");
    setEnv("BACKUP_DEFAULT_CRON", "30 4 * * *");
    setEnv("BACKUP_BASE_PATH", "/var/backups/unibackup");
    setEnv("BACKUP_DEFAULT_COMPRESSION", "none");
    setEnv("BACKUP_VERIFICATION_TYPES", "checksum,restore-test");

    BackupConfig config = createDefaultBackupConfig();
    EXPECT_EQ(config.global.maxParallelJobs, 7);
    EXPECT_EQ(config.defaultSchedule.cron, "30 4 * * *");
    ASSERT_EQ(config.destinations.size(), 1u);
    EXPECT_EQ(config.destinations.front().path, "/var/backups/unibackup");
    EXPECT_EQ(config.global.catalogDirectory, "/var/backups/unibackup/catalog");
    ASSERT_EQ(config.global.verificationTypes.size(), 2u);
    EXPECT_EQ(config.global.verificationTypes[1], VerificationType::RestoreTest);

    const StorageBackupConfig* postgres = config.findStorageConfig("postgres");
    ASSERT_NE(postgres, nullptr);
    EXPECT_EQ(postgres->compression, CompressionType::None);
    EXPECT_EQ(postgres->options["format"], "custom");
}

TEST_F(BackupConfigTest, PostgresCanBeDisabledFromEnvironment) {
    setEnv("BACKUP_POSTGRES_ENABLED", "false");
    EXPECT_TRUE(createDefaultBackupConfig().storageConfigs.empty());
}

TEST_F(BackupConfigTest, LoadFallsBackToDefaultsOnBadFile) {
    std::string path = (tempDir_->path() / "broken.json").string();
    writeFile(path, "{ not json");
    BackupConfig loaded = loadBackupConfig(path);
    EXPECT_EQ(loaded.global.maxParallelJobs, createDefaultBackupConfig().global.maxParallelJobs);

    BackupConfig missing = loadBackupConfig((tempDir_->path() / "missing.json").string());
    EXPECT_FALSE(missing.destinations.empty());
}

TEST_F(BackupConfigTest, SaveThenLoadMergesOverDefaults) {
    std::string path = (tempDir_->path() / "config.json").string();
    config_.global.maxParallelJobs = 4;
    ASSERT_TRUE(saveBackupConfig(config_, path));

    BackupConfig loaded = loadBackupConfig(path);
    EXPECT_EQ(loaded.global.maxParallelJobs, 4);
    EXPECT_EQ(loaded.destinations.front().path, config_.destinations.front().path);
}
