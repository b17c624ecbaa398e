#pragma once

#include <stdexcept>
#include <string>

enum class BackupErrorCode {
    NotConfigured,
    NotEnabled,
    NoHandler,
    Unavailable,
    ToolMissing,
    NotFound,
    VerificationFailed,
    ExternalToolFailure,
    Timeout,
    Cancelled,
    InvalidConfig,
    ShuttingDown,
    Internal
};

std::string toString(BackupErrorCode code);

class BackupError : public std::runtime_error {
public:
    BackupError(BackupErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    BackupErrorCode code() const { return code_; }

private:
    BackupErrorCode code_;
};

// An external tool exited non-zero. Carries what the tool printed.
class ProcessError : public BackupError {
public:
    ProcessError(const std::string& message, int exitCode,
                 std::string stdoutText, std::string stderrText)
        : BackupError(BackupErrorCode::ExternalToolFailure, message)
        , exitCode_(exitCode)
        , stdout_(std::move(stdoutText))
        , stderr_(std::move(stderrText)) {}

    int exitCode() const { return exitCode_; }
    const std::string& stdoutText() const { return stdout_; }
    const std::string& stderrText() const { return stderr_; }

private:
    int exitCode_;
    std::string stdout_;
    std::string stderr_;
};
