/*
 * clipforge - Render Orchestration Primitive
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "clipforge/process.hpp"
#include "clipforge/logger.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace clipforge {

namespace {

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Only async-signal-safe calls between fork() and exec.
[[noreturn]] void execChild(char* const* argv, OutputCapture capture, int outFd, int errFd) {
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
    }

    switch (capture) {
        case OutputCapture::Combined:
            ::dup2(outFd, STDOUT_FILENO);
            ::dup2(outFd, STDERR_FILENO);
            break;
        case OutputCapture::StdoutOnly:
            ::dup2(outFd, STDOUT_FILENO);
            if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
            break;
        case OutputCapture::Discard:
            if (devnull >= 0) {
                ::dup2(devnull, STDOUT_FILENO);
                ::dup2(devnull, STDERR_FILENO);
            }
            break;
    }

    ::execvp(argv[0], argv);

    int err = errno;
    ssize_t ignored = ::write(errFd, &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
}

}

ProcessResult runProcess(const std::vector<std::string>& argv, OutputCapture capture) noexcept {
    ProcessResult result;
    if (argv.empty() || argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};

    try {
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        // CLOEXEC keeps concurrent jobs' pipes out of each other's children
        if (::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
            result.error = std::string("pipe failed: ") + std::strerror(errno);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(errPipe[0]); closeFd(errPipe[1]);
            return result;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            result.error = std::string("fork failed: ") + std::strerror(errno);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(errPipe[0]); closeFd(errPipe[1]);
            return result;
        }
        if (pid == 0) {
            execChild(args.data(), capture, outPipe[1], errPipe[1]);
        }

        closeFd(outPipe[1]);
        closeFd(errPipe[1]);

        std::array<char, 4096> buffer;
        while (true) {
            ssize_t n = ::read(outPipe[0], buffer.data(), buffer.size());
            if (n > 0) {
                result.output.append(buffer.data(), static_cast<std::size_t>(n));
            } else if (n == 0) {
                break;
            } else if (errno != EINTR) {
                LOG_WARN("Reading output of " + argv[0] + " failed: " + std::strerror(errno));
                break;
            }
        }
        closeFd(outPipe[0]);

        int execErr = 0;
        ssize_t got;
        do {
            got = ::read(errPipe[0], &execErr, sizeof(execErr));
        } while (got < 0 && errno == EINTR);
        closeFd(errPipe[0]);

        int status = 0;
        pid_t waited;
        do {
            waited = ::waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (got == static_cast<ssize_t>(sizeof(execErr))) {
            result.error = "cannot execute " + argv[0] + ": " + std::strerror(execErr);
            result.exitCode = 127;
            LOG_DEBUG(result.error);
            return result;
        }
        if (waited < 0) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }

        result.started = true;
        if (WIFEXITED(status)) {
            result.exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exitCode = 128 + WTERMSIG(status);
        }
        LOG_TRACE("Process " + argv[0] + " exited with " + std::to_string(result.exitCode));
        return result;
    } catch (const std::exception& e) {
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(errPipe[0]); closeFd(errPipe[1]);
        result.error = std::string("process error: ") + e.what();
        return result;
    }
}

std::string formatCommand(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        if (arg.find_first_of(" \t'\"") != std::string::npos) {
            line += "'" + arg + "'";
        } else {
            line += arg;
        }
    }
    return line;
}

}
