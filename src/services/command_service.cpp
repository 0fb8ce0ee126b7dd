/*
 * Copyright (C) 2026 Codyard
 *
 * This file is part of KioskControl.
 *
 * KioskControl is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * KioskControl is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with KioskControl. If not, see <https://www.gnu.org/licenses/\>.
 */
#include "services/command_service.h"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace kioskctl {

namespace {

const size_t kMaxOutputBytes = 1024 * 1024;

void ClosePipe(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

// 继承当前环境，再用 overrides 覆盖同名变量
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        size_t eq = entry.find('=');
        std::string key = (eq == std::string::npos) ? entry : entry.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            out.push_back(entry);
        }
    }
    for (const auto& kv : overrides) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

void DrainFd(int fd, std::string& sink) {
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            if (sink.size() < kMaxOutputBytes) {
                sink.append(buf, static_cast<size_t>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
}

} // namespace

CommandResult CommandService::executeCommand(const std::vector<std::string>& argv,
                                             const std::map<std::string, std::string>& env,
                                             int timeoutMs) {
    if (argv.empty() || argv[0].empty()) {
        throw std::runtime_error("Empty command");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> envStrings = BuildEnvironment(env);
    std::vector<char*> cenv;
    cenv.reserve(envStrings.size() + 1);
    for (auto& e : envStrings) cenv.push_back(const_cast<char*>(e.c_str()));
    cenv.push_back(nullptr);

    int outP[2] = {-1, -1};
    int errP[2] = {-1, -1};
    int execP[2] = {-1, -1};
    if (::pipe2(outP, O_CLOEXEC) != 0) {
        throw std::runtime_error("Failed to create stdout pipe");
    }
    if (::pipe2(errP, O_CLOEXEC) != 0) {
        ClosePipe(outP);
        throw std::runtime_error("Failed to create stderr pipe");
    }
    // exec 成功时 CLOEXEC 自动关闭写端，失败时子进程写回 errno
    if (::pipe2(execP, O_CLOEXEC) != 0) {
        ClosePipe(outP);
        ClosePipe(errP);
        throw std::runtime_error("Failed to create exec status pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ClosePipe(outP);
        ClosePipe(errP);
        ClosePipe(execP);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(outP[1], STDOUT_FILENO);
        ::dup2(errP[1], STDERR_FILENO);
        ::close(outP[0]); ::close(outP[1]);
        ::close(errP[0]); ::close(errP[1]);
        ::close(execP[0]);
        ::execvpe(cargv[0], cargv.data(), cenv.data());
        int err = errno;
        ssize_t ignored = ::write(execP[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(outP[1]);
    ::close(errP[1]);
    ::close(execP[1]);

    int execErr = 0;
    ssize_t n;
    do {
        n = ::read(execP[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    ::close(execP[0]);
    if (n == static_cast<ssize_t>(sizeof(execErr))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(outP[0]);
        ::close(errP[0]);
        throw std::runtime_error("Failed to execute " + argv[0] + ": " + std::strerror(execErr));
    }

    ::fcntl(outP[0], F_SETFL, ::fcntl(outP[0], F_GETFL, 0) | O_NONBLOCK);
    ::fcntl(errP[0], F_SETFL, ::fcntl(errP[0], F_GETFL, 0) | O_NONBLOCK);

    CommandResult result{};
    std::string outText;
    std::string errText;
    int status = 0;
    bool timedOut = false;
    auto start = std::chrono::steady_clock::now();

    for (;;) {
        struct pollfd fds[2] = {
            {outP[0], POLLIN, 0},
            {errP[0], POLLIN, 0}
        };
        ::poll(fds, 2, 10);
        DrainFd(outP[0], outText);
        DrainFd(errP[0], errText);

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) {
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, &status, 0);
            timedOut = true;
            break;
        }
    }

    DrainFd(outP[0], outText);
    DrainFd(errP[0], errText);
    ::close(outP[0]);
    ::close(errP[0]);

    result.stdoutText = sanitizeOutput(outText, kMaxOutputBytes);
    result.stderrText = sanitizeOutput(errText, kMaxOutputBytes);
    result.timedOut = timedOut;
    if (timedOut) {
        result.exitCode = 124;
    } else if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    } else {
        result.exitCode = 1;
    }
    return result;
}

std::string CommandService::sanitizeOutput(const std::string& output, size_t maxLength) {
    if (output.size() <= maxLength) {
        return output;
    }
    return output.substr(0, maxLength);
}

} // namespace kioskctl
