#include <gtest/gtest.h>
#include "backup/destination_handler.hpp"
#include "common/backup_error.hpp"
#include "common/utils.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

class StorageBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("storage-test");
        base_ = tempDir_->path();
        backend_ = std::make_shared<FakeBackend>();
        config_.type = "fake";
        config_.compression = CompressionType::Gzip;
    }

    void TearDown() override {
        tempDir_.reset();
    }

    BackupMetadata metadataFor(const std::vector<std::string>& files) const {
        BackupMetadata metadata;
        metadata.id = "fake-storage";
        metadata.storageType = "fake";
        metadata.status = BackupStatus::Completed;
        metadata.files = files;
        metadata.checksums = BaseStorageBackend::calculateChecksums(files);
        return metadata;
    }

    std::unique_ptr<ScopedDirectory> tempDir_;
    fs::path base_;
    std::shared_ptr<FakeBackend> backend_;
    StorageBackupConfig config_;
};

TEST_F(StorageBackendTest, GzipArtifactsRestoreToOriginalContent) {
    auto files = backend_->createBackup(config_, (base_ / "work").string(), std::make_shared<CancellationToken>());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_TRUE(utils::endsWith(files.front(), ".dat.gz"));
    EXPECT_FALSE(fs::exists(base_ / "work" / "fake_backup.dat"));

    RestoreOptions options;
    options.targetPath = (base_ / "restored").string();
    ASSERT_TRUE(backend_->restoreBackup(metadataFor(files), options, nullptr));
    EXPECT_EQ(readFile(base_ / "restored" / "fake_backup.dat"), backend_->payload);
    ASSERT_EQ(backend_->lastRestoredFiles().size(), 1u);
    EXPECT_EQ(fs::path(backend_->lastRestoredFiles().front()).filename(), "fake_backup.dat");
}

TEST_F(StorageBackendTest, UncompressedArtifactsAreLeftAlone) {
    config_.compression = CompressionType::None;
    auto files = backend_->createBackup(config_, (base_ / "work").string(), nullptr);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(readFile(files.front()), backend_->payload);
}

TEST_F(StorageBackendTest, RestoreRefusesTamperedArchiveWhenVerifying) {
    config_.compression = CompressionType::None;
    auto files = backend_->createBackup(config_, (base_ / "work").string(), nullptr);
    BackupMetadata metadata = metadataFor(files);
    writeFile(files.front(), "tampered");

    RestoreOptions options;
    options.targetPath = (base_ / "restored").string();
    options.verify = true;
    EXPECT_FALSE(backend_->restoreBackup(metadata, options, nullptr));
    EXPECT_EQ(backend_->restoreCalls, 0);
    EXPECT_FALSE(backend_->getLastError().empty());
}

TEST_F(StorageBackendTest, RestoreSelectsRequestedFiles) {
    config_.compression = CompressionType::None;
    auto files = backend_->createBackup(config_, (base_ / "work").string(), nullptr);
    BackupMetadata metadata = metadataFor(files);

    RestoreOptions options;
    options.files = {"something-else.dat"};
    EXPECT_FALSE(backend_->restoreBackup(metadata, options, nullptr));

    options.files = {"fake_backup.dat"};
    options.targetPath = (base_ / "restored").string();
    EXPECT_TRUE(backend_->restoreBackup(metadata, options, nullptr));
}

TEST_F(StorageBackendTest, CancelledTokenStopsCreate) {
    backend_->hold = true;
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    try {
        backend_->createBackup(config_, (base_ / "work").string(), token);
        FAIL() << "expected createBackup to throw";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), BackupErrorCode::Cancelled);
    }
}

TEST_F(StorageBackendTest, DefaultVerificationUsesChecksums) {
    config_.compression = CompressionType::None;
    auto files = backend_->createBackup(config_, (base_ / "work").string(), nullptr);
    BackupMetadata metadata = metadataFor(files);
    EXPECT_TRUE(backend_->verifyBackup(metadata, VerificationType::Checksum));
    EXPECT_TRUE(backend_->verifyBackup(metadata, VerificationType::RestoreTest));

    fs::remove(files.front());
    EXPECT_FALSE(backend_->verifyBackup(metadata, VerificationType::SizeValidation));
}

TEST_F(StorageBackendTest, DirectoryChecksumCoversContents) {
    fs::path dir = base_ / "dump.dir";
    writeFile(dir / "toc.dat", "toc");
    writeFile(dir / "3001.dat", "rows");
    std::string before = utils::sha256Path(dir.string());
    EXPECT_EQ(before.size(), 64u);
    EXPECT_EQ(before, utils::sha256Path(dir.string()));

    writeFile(dir / "3001.dat", "other rows");
    EXPECT_NE(before, utils::sha256Path(dir.string()));
}

class LocalDestinationTest : public StorageBackendTest {};

TEST_F(LocalDestinationTest, UploadWriteMetadataAndRemove) {
    config_.compression = CompressionType::None;
    auto files = backend_->createBackup(config_, (base_ / "work").string(), nullptr);
    BackupMetadata metadata = metadataFor(files);

    BackupDestination destination;
    destination.path = (base_ / "dest").string();
    LocalDestinationHandler handler;

    auto stored = handler.upload(files, destination, metadata);
    ASSERT_EQ(stored.size(), 1u);
    fs::path dir = base_ / "dest" / "fake" / "fake-storage";
    EXPECT_EQ(fs::path(stored.front()), dir / "fake_backup.dat");
    EXPECT_EQ(LocalDestinationHandler::backupDirectory(destination, metadata), dir.string());

    ASSERT_TRUE(handler.writeMetadata(metadata, destination));
    nlohmann::json record = nlohmann::json::parse(readFile(dir / "metadata.json"));
    EXPECT_EQ(record["id"], "fake-storage");

    EXPECT_TRUE(handler.remove(metadata, destination));
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_TRUE(handler.remove(metadata, destination));
}
