/*
 * negsim - Negotiation Simulation Queue
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "negsim/subprocess.hpp"
#include "negsim/logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace negsim {

namespace {
constexpr std::size_t kErrorTailBytes = 2000;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int waitChild(pid_t pid, ProcessOutcome& outcome) noexcept {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) {
        outcome.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.signal = WTERMSIG(status);
    }
    return 0;
}
}

std::string ProcessOutcome::describe() const {
    if (!started) return error.empty() ? "process did not start" : error;
    std::string text = signal != 0 ? "terminated by signal " + std::to_string(signal)
                                   : "exited with status " + std::to_string(exitCode);
    if (!errorTail.empty()) {
        text += ": " + errorTail;
    }
    return text;
}

ProcessOutcome runProcess(const std::string& command, const std::vector<std::string>& args,
                          const LineHandler& onLine, const SpawnHandler& onSpawn) {
    ProcessOutcome outcome;
    if (command.empty()) {
        outcome.error = "no command configured";
        return outcome;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
        outcome.error = std::string("pipe failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return outcome;
    }

    std::vector<std::string> argvStr{"/bin/sh", "-c", command + " \"$@\"", "negsim"};
    argvStr.insert(argvStr.end(), args.begin(), args.end());
    std::vector<char*> argv;
    argv.reserve(argvStr.size() + 1);
    for (auto& s : argvStr) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.error = std::string("fork failed: ") + std::strerror(errno);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return outcome;
    }
    if (pid == 0) {
        // own process group, so a cancel reaches every descendant
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::execv("/bin/sh", argv.data());
        std::_Exit(127);
    }

    // mirrored in the parent so an early cancel finds the group
    (void)::setpgid(pid, pid);
    outcome.started = true;
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    try {
        if (onSpawn) onSpawn(pid);

        std::string pending;
        std::array<char, 4096> buf{};
        std::array<pollfd, 2> fds{{{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}}};
        while (fds[0].fd >= 0 || fds[1].fd >= 0) {
            int ready = ::poll(fds.data(), fds.size(), -1);
            if (ready < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }
            for (std::size_t i = 0; i < fds.size(); ++i) {
                if (fds[i].fd < 0 || fds[i].revents == 0) continue;
                ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
                if (n < 0 && errno == EINTR) continue;
                if (n <= 0) {
                    closeFd(i == 0 ? outPipe[0] : errPipe[0]);
                    fds[i].fd = -1;
                    continue;
                }
                if (i == 1) {
                    outcome.errorTail.append(buf.data(), static_cast<std::size_t>(n));
                    if (outcome.errorTail.size() > kErrorTailBytes) {
                        outcome.errorTail.erase(0, outcome.errorTail.size() - kErrorTailBytes);
                    }
                    continue;
                }
                pending.append(buf.data(), static_cast<std::size_t>(n));
                std::size_t newline;
                while ((newline = pending.find('\n')) != std::string::npos) {
                    std::string line = pending.substr(0, newline);
                    pending.erase(0, newline + 1);
                    if (!line.empty() && line.back() == '\r') line.pop_back();
                    if (onLine) onLine(line);
                }
            }
        }
        if (!pending.empty() && onLine) {
            onLine(pending);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Subprocess handling failed, killing pid " + std::to_string(pid) + ": " + e.what());
        ::kill(-pid, SIGKILL);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        (void)waitChild(pid, outcome);
        throw;
    }

    while (!outcome.errorTail.empty() &&
           (outcome.errorTail.back() == '\n' || outcome.errorTail.back() == '\r')) {
        outcome.errorTail.pop_back();
    }

    if (waitChild(pid, outcome) != 0) {
        outcome.error = std::string("waitpid failed: ") + std::strerror(errno);
        outcome.exitCode = -1;
    }
    return outcome;
}

}
