#include "common/process_runner.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

extern char** environ;

namespace {

constexpr int kExecFailedExit = 127;
const auto kKillGracePeriod = std::chrono::seconds(5);

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& extra) {
    std::map<std::string, std::string> merged;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto pos = kv.find('=');
        if (pos != std::string::npos) {
            merged[kv.substr(0, pos)] = kv.substr(pos + 1);
        }
    }
    for (const auto& kv : extra) {
        merged[kv.first] = kv.second;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& kv : merged) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

std::string describeCommand(const std::string& program, const std::vector<std::string>& args) {
    std::stringstream ss;
    ss << program;
    for (const auto& arg : args) {
        ss << " " << arg;
    }
    return ss.str();
}

} // namespace

ProcessResult ProcessRunner::run(const std::string& program,
                                 const std::vector<std::string>& args,
                                 const ProcessOptions& options) {
    std::string resolved = program.find('/') != std::string::npos ? program : findExecutable(program);
    if (resolved.empty()) {
        throw BackupError(BackupErrorCode::ToolMissing, program + " command not found");
    }

    if (options.cancelToken && options.cancelToken->isCancelled()) {
        ProcessResult result;
        result.cancelled = true;
        return result;
    }

    Logger::debug("Executing: " + describeCommand(program, args));

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    // Close-on-exec keeps these ends out of children forked by other runs
    if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        throw BackupError(BackupErrorCode::Internal,
                          std::string("Failed to create pipes: ") + std::strerror(errno));
    }

    std::vector<std::string> envStrings = buildEnvironment(options.env);
    std::vector<char*> envp;
    for (auto& entry : envStrings) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(resolved.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        throw BackupError(BackupErrorCode::Internal,
                          std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Own process group so a timeout also reaches grandchildren
        setpgid(0, 0);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        close(outPipe[0]);
        close(outPipe[1]);
        close(errPipe[0]);
        close(errPipe[1]);
        if (!options.workingDirectory.empty() && chdir(options.workingDirectory.c_str()) != 0) {
            _exit(kExecFailedExit);
        }
        execve(argv[0], argv.data(), envp.data());
        _exit(kExecFailedExit);
    }

    setpgid(pid, pid);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    fcntl(outPipe[0], F_SETFL, O_NONBLOCK);
    fcntl(errPipe[0], F_SETFL, O_NONBLOCK);

    ProcessResult result;
    auto start = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point killDeadline{};
    bool terminating = false;
    int status = 0;
    bool exited = false;
    bool waitFailed = false;
    std::chrono::steady_clock::time_point exitedAt{};

    auto drain = [](int& fd, std::string& sink) {
        if (fd < 0) {
            return;
        }
        char buffer[4096];
        while (true) {
            ssize_t n = read(fd, buffer, sizeof(buffer));
            if (n > 0) {
                sink.append(buffer, static_cast<size_t>(n));
            } else if (n == 0) {
                closeFd(fd);
                return;
            } else {
                return;   // EAGAIN or error, try again later
            }
        }
    };

    while (!exited || outPipe[0] >= 0 || errPipe[0] >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (outPipe[0] >= 0) fds[count++] = {outPipe[0], POLLIN, 0};
        if (errPipe[0] >= 0) fds[count++] = {errPipe[0], POLLIN, 0};
        if (count > 0) {
            poll(fds, count, 100);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        drain(outPipe[0], result.stdoutText);
        drain(errPipe[0], result.stderrText);

        if (!exited) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
                exitedAt = std::chrono::steady_clock::now();
            } else if (waited < 0 && errno != EINTR) {
                exited = true;
                exitedAt = std::chrono::steady_clock::now();
                waitFailed = true;
            }
        }

        if (exited) {
            // A detached grandchild may keep the pipes open
            if (std::chrono::steady_clock::now() - exitedAt > std::chrono::seconds(2)) {
                break;
            }
            continue;
        }

        auto nowTime = std::chrono::steady_clock::now();
        if (!terminating) {
            if (options.timeout.count() > 0 && nowTime - start >= options.timeout) {
                result.timedOut = true;
            }
            if (options.cancelToken && options.cancelToken->isCancelled()) {
                result.cancelled = true;
            }
            if (result.timedOut || result.cancelled) {
                Logger::warning(std::string("Terminating ") + program +
                                (result.timedOut ? " after timeout" : " on cancellation"));
                kill(-pid, SIGTERM);
                terminating = true;
                killDeadline = nowTime + kKillGracePeriod;
            }
        } else if (nowTime >= killDeadline) {
            kill(-pid, SIGKILL);
            killDeadline = nowTime + std::chrono::hours(24);
        }
    }

    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    if (waitFailed) {
        Logger::error("waitpid failed for " + program + ": " + std::strerror(errno));
        result.exitCode = -1;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }

    if (result.exitCode == kExecFailedExit && result.stdoutText.empty() && result.stderrText.empty()) {
        throw BackupError(BackupErrorCode::ToolMissing, "Failed to execute " + program);
    }

    Logger::debug(program + " exited with code " + std::to_string(result.exitCode));
    return result;
}

ProcessResult ProcessRunner::runChecked(const std::string& program,
                                        const std::vector<std::string>& args,
                                        const ProcessOptions& options) {
    ProcessResult result = run(program, args, options);
    if (result.cancelled) {
        throw BackupError(BackupErrorCode::Cancelled, program + " cancelled");
    }
    if (result.timedOut) {
        std::stringstream ss;
        ss << program << " timed out after "
           << std::chrono::duration_cast<std::chrono::seconds>(options.timeout).count() << "s";
        throw BackupError(BackupErrorCode::Timeout, ss.str());
    }
    if (result.exitCode != 0) {
        std::string detail = utils::trim(result.stderrText);
        throw ProcessError(program + " failed with exit code " + std::to_string(result.exitCode) +
                               (detail.empty() ? "" : ": " + detail),
                           result.exitCode, result.stdoutText, result.stderrText);
    }
    return result;
}

ProcessResult ProcessRunner::runShell(const std::string& command, const ProcessOptions& options) {
    return run("/bin/sh", {"-c", command}, options);
}

std::string ProcessRunner::findExecutable(const std::string& name) {
    if (name.empty()) {
        return "";
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    std::string path = utils::getEnvOr("PATH", "/usr/local/bin:/usr/bin:/bin");
    for (const auto& dir : utils::split(path, ':')) {
        if (dir.empty()) {
            continue;
        }
        std::filesystem::path candidate = std::filesystem::path(dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) &&
            access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

bool ProcessRunner::isCommandAvailable(const std::string& name) {
    return !findExecutable(name).empty();
}
