#include <gtest/gtest.h>
#include "backup/backup_verifier.hpp"
#include "backup/base_storage_backend.hpp"
#include "common/utils.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;

class BackupVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("verifier-test");
        base_ = tempDir_->path();

        config_.scratchDirectory = (base_ / "scratch").string();
        config_.reportDirectory = (base_ / "reports").string();
        verifier_ = std::make_unique<BackupVerifier>(config_);
        backend_ = std::make_shared<FakeBackend>();

        fs::path dir = base_ / "artifacts";
        first_ = (dir / "first.dat").string();
        second_ = (dir / "second.dat").string();
        writeFile(first_, "first artifact");
        writeFile(second_, "second artifact, a bit longer");

        metadata_.id = "fake-verify";
        metadata_.storageType = "fake";
        metadata_.status = BackupStatus::Completed;
        metadata_.files = {first_, second_};
        metadata_.checksums = BaseStorageBackend::calculateChecksums(metadata_.files);
        metadata_.size = utils::pathSize(first_) + utils::pathSize(second_);
    }

    void TearDown() override {
        verifier_.reset();
        tempDir_.reset();
    }

    // Executable shell script under the temp dir
    std::string writeScript(const std::string& name, const std::string& body) {
        fs::path script = base_ / "scripts" / name;
        writeFile(script, "#!/bin/sh\n" + body + "\n");
        fs::permissions(script, fs::perms::owner_all);
        return script.string();
    }

    std::unique_ptr<ScopedDirectory> tempDir_;
    fs::path base_;
    VerificationConfig config_;
    std::unique_ptr<BackupVerifier> verifier_;
    std::shared_ptr<FakeBackend> backend_;
    std::string first_;
    std::string second_;
    BackupMetadata metadata_;
};

TEST_F(BackupVerifierTest, ChecksumPassesForIntactFiles) {
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::Checksum);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.type, "checksum");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.details["verifiedFiles"].get<size_t>(), 2u);
}

TEST_F(BackupVerifierTest, ChecksumMismatchIsReported) {
    writeFile(second_, "altered");
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::Checksum);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Checksum mismatch: " + second_);
    EXPECT_EQ(result.details["failedFiles"].get<size_t>(), 1u);
}

TEST_F(BackupVerifierTest, SequentialChecksumMatchesParallel) {
    config_.enableParallelChecks = false;
    BackupVerifier sequential(config_);
    writeFile(first_, "altered");
    VerificationResult result = sequential.verifyBackup(metadata_, VerificationType::Checksum);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Checksum mismatch: " + first_);
}

TEST_F(BackupVerifierTest, MissingFileIsOneSizeError) {
    fs::remove(second_);
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::SizeValidation);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Missing file: second.dat");
}

TEST_F(BackupVerifierTest, EmptyFileIsWarningOnly) {
    writeFile(second_, "");
    metadata_.size = utils::pathSize(first_);
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::SizeValidation);
    EXPECT_TRUE(result.passed);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings.front(), "1 empty files found");
    EXPECT_EQ(result.details["emptyFiles"].get<size_t>(), 1u);
}

TEST_F(BackupVerifierTest, SizeDriftIsWarning) {
    metadata_.size += 10;
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::SizeValidation);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST_F(BackupVerifierTest, IntegrityCheckNeedsBackend) {
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "No storage handler provided for integrity check");
}

TEST_F(BackupVerifierTest, IntegrityCheckUsesBackend) {
    EXPECT_TRUE(verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck, backend_).passed);

    backend_->failIntegrity = true;
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck, backend_);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Backend integrity check failed: fake archive is corrupt");
}

TEST_F(BackupVerifierTest, CustomScriptsRunDuringIntegrityCheck) {
    metadata_.destination.path = (base_ / "dest").string();
    fs::path argsFile = base_ / "script-args.txt";
    std::string passing = writeScript("pass.sh", "echo \"$1 $2\" > " + argsFile.string() + "; echo looks good");
    config_.customScripts["fake"] = {passing};
    verifier_ = std::make_unique<BackupVerifier>(config_);

    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck, backend_);
    EXPECT_TRUE(result.passed);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_EQ(result.details["customScripts"].size(), 1u);
    EXPECT_EQ(result.details["customScripts"][0]["exitCode"], 0);
    EXPECT_EQ(result.details["customScripts"][0]["output"], "looks good");
    EXPECT_EQ(readFile(argsFile), "fake-verify " + metadata_.destination.path + "\n");
}

TEST_F(BackupVerifierTest, FailingCustomScriptFailsIntegrityCheck) {
    std::string failing = writeScript("fail.sh", "exit 2");
    config_.customScripts["fake"] = {failing};
    config_.customScripts["other"] = {writeScript("unused.sh", "exit 9")};
    verifier_ = std::make_unique<BackupVerifier>(config_);

    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck, backend_);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Custom verification script failed: " + failing + " (exit 2)");
    EXPECT_EQ(result.details["customScripts"].size(), 1u);
}

TEST_F(BackupVerifierTest, SlowCustomScriptTimesOut) {
    std::string slow = writeScript("slow.sh", "sleep 30");
    config_.customScripts["fake"] = {slow};
    config_.timeoutSeconds = 1;
    verifier_ = std::make_unique<BackupVerifier>(config_);

    auto started = std::chrono::steady_clock::now();
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::IntegrityCheck, backend_);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(15));
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Custom verification script timed out: " + slow);
}

TEST_F(BackupVerifierTest, UnknownTypeNameFails) {
    VerificationResult result = verifier_->verifyBackup(metadata_, std::string("telepathy"), backend_);
    EXPECT_FALSE(result.passed);
    EXPECT_EQ(result.type, "telepathy");
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST_F(BackupVerifierTest, RestoreTestNeedsBackend) {
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::RestoreTest);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "No storage handler provided for restore test");
}

TEST_F(BackupVerifierTest, RestoreTestCountsRestoredFiles) {
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::RestoreTest, backend_);
    EXPECT_TRUE(result.passed);
    EXPECT_EQ(result.details["restoredFiles"].get<size_t>(), 2u);
    EXPECT_EQ(backend_->restoreCalls, 1);
    EXPECT_FALSE(fs::exists(base_ / "scratch" / "restore-test" / metadata_.id));
}

TEST_F(BackupVerifierTest, RestoreTestFailureStillCleansUp) {
    backend_->throwOnRestore = true;
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::RestoreTest, backend_);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Test restore failed: fake_restore crashed");
    EXPECT_FALSE(fs::exists(base_ / "scratch" / "restore-test" / metadata_.id));
}

TEST_F(BackupVerifierTest, RestoreTestRejectedByBackend) {
    backend_->restoreResult = false;
    VerificationResult result = verifier_->verifyBackup(metadata_, VerificationType::RestoreTest, backend_);
    EXPECT_FALSE(result.passed);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors.front(), "Test restore failed: fake restore rejected the archive");
}

TEST_F(BackupVerifierTest, ComprehensiveKeepsInputOrder) {
    std::vector<VerificationType> types{VerificationType::SizeValidation, VerificationType::Checksum,
                                        VerificationType::IntegrityCheck, VerificationType::RestoreTest};
    auto results = verifier_->verifyBackupComprehensive(metadata_, types, backend_);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].type, "size-validation");
    EXPECT_EQ(results[1].type, "checksum");
    EXPECT_EQ(results[2].type, "integrity-check");
    EXPECT_EQ(results[3].type, "restore-test");
    EXPECT_TRUE(BackupVerifier::allPassed(results));
}

TEST_F(BackupVerifierTest, ReportSummarizesResults) {
    writeFile(first_, "altered");
    auto results = verifier_->quickVerify(metadata_);
    nlohmann::json report = verifier_->createVerificationReport(metadata_, results);

    const auto& overall = report["overallResult"];
    EXPECT_FALSE(overall["passed"].get<bool>());
    EXPECT_EQ(overall["totalChecks"].get<size_t>(), 2u);
    EXPECT_EQ(overall["passedChecks"].get<size_t>(), 1u);
    EXPECT_EQ(overall["failedChecks"].get<size_t>(), 1u);
    EXPECT_DOUBLE_EQ(overall["successRate"].get<double>(), 50.0);
    EXPECT_EQ(report["backupId"], "fake-verify");
    EXPECT_EQ(report["verifications"].size(), 2u);
}

TEST_F(BackupVerifierTest, ReportIsSavedOnlyOnFailure) {
    std::string reportPath;
    auto passing = verifier_->verifyAndReport(metadata_, {VerificationType::Checksum}, nullptr, &reportPath);
    EXPECT_TRUE(BackupVerifier::allPassed(passing));
    EXPECT_TRUE(reportPath.empty());
    EXPECT_FALSE(fs::exists(base_ / "reports"));

    fs::remove(first_);
    auto failing = verifier_->verifyAndReport(metadata_, {VerificationType::Checksum}, nullptr, &reportPath);
    EXPECT_FALSE(BackupVerifier::allPassed(failing));
    ASSERT_FALSE(reportPath.empty());
    EXPECT_TRUE(fs::exists(reportPath));
    EXPECT_EQ(fs::path(reportPath).parent_path(), base_ / "reports");

    nlohmann::json saved = nlohmann::json::parse(readFile(reportPath));
    EXPECT_EQ(saved["backupId"], "fake-verify");
    EXPECT_FALSE(saved["overallResult"]["passed"].get<bool>());
}
