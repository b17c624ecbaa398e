#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>

#include "common/cancellation_token.hpp"

struct ProcessOptions {
    // Added to (or overriding) the parent environment of the child only.
    std::map<std::string, std::string> env;
    std::chrono::milliseconds timeout{0};   // 0 = no timeout
    std::string workingDirectory;
    CancellationTokenPtr cancelToken;
};

struct ProcessResult {
    int exitCode{-1};
    std::string stdoutText;
    std::string stderrText;
    bool timedOut{false};
    bool cancelled{false};

    bool success() const { return exitCode == 0 && !timedOut && !cancelled; }
};

class ProcessRunner {
public:
    // Runs program with args (no shell). The child is sent SIGTERM, then
    // SIGKILL after a grace period, when the timeout expires or the token
    // is cancelled. Throws BackupError(ToolMissing) if program cannot be
    // executed at all.
    static ProcessResult run(const std::string& program,
                             const std::vector<std::string>& args,
                             const ProcessOptions& options = {});

    // Like run(), but throws BackupError(Timeout|Cancelled) or ProcessError
    // on a non-zero exit.
    static ProcessResult runChecked(const std::string& program,
                                    const std::vector<std::string>& args,
                                    const ProcessOptions& options = {});

    // Runs a command line through /bin/sh -c.
    static ProcessResult runShell(const std::string& command,
                                  const ProcessOptions& options = {});

    // Resolves a program name against PATH. Empty if not found.
    static std::string findExecutable(const std::string& name);
    static bool isCommandAvailable(const std::string& name);
};
