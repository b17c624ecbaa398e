#include <gtest/gtest.h>
#include "common/backup_error.hpp"
#include "common/process_runner.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <vector>
#include <thread>

using namespace std::chrono_literals;

class ProcessRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("process-test");
    }

    void TearDown() override {
        tempDir_.reset();
    }

    std::unique_ptr<ScopedDirectory> tempDir_;
};

TEST_F(ProcessRunnerTest, CapturesOutputAndExitCode) {
    ProcessResult result = ProcessRunner::runShell("echo out; echo err 1>&2; exit 3");
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.stdoutText, "out\n");
    EXPECT_EQ(result.stderrText, "err\n");
}

TEST_F(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    ProcessResult result = ProcessRunner::run("echo", {"$HOME", "a b"});
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdoutText, "$HOME a b\n");
}

TEST_F(ProcessRunnerTest, ExtraEnvironmentReachesChildOnly) {
    ProcessOptions options;
    options.env["UNIBACKUP_TEST_VALUE"] = "from-parent";
    ProcessResult result = ProcessRunner::runShell("printf %s \"$UNIBACKUP_TEST_VALUE\"", options);
    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.stdoutText, "from-parent");
    EXPECT_EQ(std::getenv("UNIBACKUP_TEST_VALUE"), nullptr);
}

TEST_F(ProcessRunnerTest, WorkingDirectoryIsApplied) {
    ProcessOptions options;
    options.workingDirectory = tempDir_->string();
    ProcessResult result = ProcessRunner::runShell("touch marker", options);
    EXPECT_TRUE(result.success());
    EXPECT_TRUE(std::filesystem::exists(tempDir_->path() / "marker"));
}

TEST_F(ProcessRunnerTest, TimeoutTerminatesChild) {
    ProcessOptions options;
    options.timeout = 200ms;
    auto started = std::chrono::steady_clock::now();
    ProcessResult result = ProcessRunner::runShell("sleep 30", options);
    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.success());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 10s);
}

TEST_F(ProcessRunnerTest, CancellationTerminatesChild) {
    ProcessOptions options;
    options.cancelToken = std::make_shared<CancellationToken>();
    std::thread canceller([token = options.cancelToken] {
        std::this_thread::sleep_for(100ms);
        token->cancel();
    });
    ProcessResult result = ProcessRunner::runShell("sleep 30", options);
    canceller.join();
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timedOut);
}

TEST_F(ProcessRunnerTest, AlreadyCancelledTokenSkipsLaunch) {
    ProcessOptions options;
    options.cancelToken = std::make_shared<CancellationToken>();
    options.cancelToken->cancel();
    ProcessResult result = ProcessRunner::runShell("touch should-not-exist", options);
    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(std::filesystem::exists("should-not-exist"));
}

TEST_F(ProcessRunnerTest, MissingProgramIsToolMissing) {
    try {
        ProcessRunner::run("unibackup-no-such-tool", {});
        FAIL() << "expected run to throw";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), BackupErrorCode::ToolMissing);
    }
    EXPECT_FALSE(ProcessRunner::isCommandAvailable("unibackup-no-such-tool"));
    EXPECT_TRUE(ProcessRunner::isCommandAvailable("sh"));
}

TEST_F(ProcessRunnerTest, CheckedRunMapsFailures) {
    try {
        ProcessRunner::runChecked("/bin/sh", {"-c", "echo boom 1>&2; exit 4"});
        FAIL() << "expected runChecked to throw";
    } catch (const ProcessError& e) {
        EXPECT_EQ(e.code(), BackupErrorCode::ExternalToolFailure);
        EXPECT_EQ(e.exitCode(), 4);
        EXPECT_EQ(e.stderrText(), "boom\n");
        EXPECT_NE(std::string(e.what()).find("boom"), std::string::npos);
    }

    ProcessOptions options;
    options.timeout = 100ms;
    try {
        ProcessRunner::runChecked("/bin/sh", {"-c", "sleep 30"}, options);
        FAIL() << "expected runChecked to throw";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), BackupErrorCode::Timeout);
    }
}

TEST_F(ProcessRunnerTest, ConcurrentLongRunDoesNotHoldShortRunOutput) {
    std::vector<std::thread> sleepers;
    for (int i = 0; i < 4; ++i) {
        sleepers.emplace_back([] { ProcessRunner::run("sleep", {"3"}); });
    }

    for (int i = 0; i < 20; ++i) {
        auto started = std::chrono::steady_clock::now();
        ProcessResult result = ProcessRunner::run("echo", {"quick"});
        EXPECT_TRUE(result.success());
        EXPECT_EQ(result.stdoutText, "quick\n");
        EXPECT_LT(std::chrono::steady_clock::now() - started, 1500ms);
    }

    for (auto& sleeper : sleepers) {
        sleeper.join();
    }
}
