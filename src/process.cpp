/*
 * hashbreaker - Multi-phase Hash Audit Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hashbreaker/process.hpp"
#include "hashbreaker/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hashbreaker {

namespace {

constexpr int READ_FD = 0;
constexpr int WRITE_FD = 1;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePair(int fds[2]) noexcept {
    closeFd(fds[READ_FD]);
    closeFd(fds[WRITE_FD]);
}

// A broken stdin pipe must surface as EPIPE, not terminate the daemon.
void ignoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void drain(int fd, std::mutex& mutex, std::string& sink) noexcept {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            try {
                std::lock_guard<std::mutex> lock(mutex);
                sink.append(buffer, static_cast<std::size_t>(n));
            } catch (const std::exception&) {
                // Out of memory: keep reading so the child never blocks on a full pipe
            }
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
}

} // namespace

std::unique_ptr<Process> Process::spawn(const std::vector<std::string>& argv,
                                        bool pipeStdin, std::string& error) {
    if (argv.empty()) {
        error = "empty command";
        return nullptr;
    }
    ignoreSigpipe();

    // Everything the child touches is prepared before fork.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execCheck[2] = {-1, -1};

    // O_CLOEXEC keeps these descriptors out of children spawned by other workers.
    if ((pipeStdin && ::pipe2(inPipe, O_CLOEXEC) != 0) ||
        ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 ||
        ::pipe2(execCheck, O_CLOEXEC) != 0) {
        error = std::string("pipe: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(execCheck);
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        error = std::string("fork: ") + std::strerror(errno);
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        closePair(execCheck);
        return nullptr;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::setpgid(0, 0);
        if (pipeStdin) {
            ::dup2(inPipe[READ_FD], STDIN_FILENO);
        } else {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
        }
        ::dup2(outPipe[WRITE_FD], STDOUT_FILENO);
        ::dup2(errPipe[WRITE_FD], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(execCheck[WRITE_FD], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(inPipe[READ_FD]);
    closeFd(outPipe[WRITE_FD]);
    closeFd(errPipe[WRITE_FD]);
    closeFd(execCheck[WRITE_FD]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execCheck[READ_FD], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execCheck[READ_FD]);

    std::unique_ptr<Process> process(new Process());
    process->pid_ = pid;
    process->stdinFd_ = inPipe[WRITE_FD];
    process->stdoutFd_ = outPipe[READ_FD];
    process->stderrFd_ = errPipe[READ_FD];

    if (n > 0) {
        error = "exec " + argv[0] + ": " + std::strerror(childErrno);
        int status = 0;
        ::waitpid(pid, &status, 0);
        process->reaped_ = true;
        return nullptr;
    }

    if (process->stdinFd_ >= 0) {
        int flags = ::fcntl(process->stdinFd_, F_GETFL);
        ::fcntl(process->stdinFd_, F_SETFL, flags | O_NONBLOCK);
    }

    process->startReaders();
    LOG_DEBUG("Spawned " + argv[0] + " pid " + std::to_string(pid));
    return process;
}

Process::~Process() {
    closeStdin();
    if (!reaped_ && pid_ > 0) {
        kill();
    }
    joinReaders();
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

void Process::startReaders() {
    int outFd = stdoutFd_;
    int errFd = stderrFd_;
    stdoutReader_ = std::thread([this, outFd] { drain(outFd, outputMutex_, stdout_); });
    stderrReader_ = std::thread([this, errFd] { drain(errFd, outputMutex_, stderr_); });
}

void Process::joinReaders() noexcept {
    if (stdoutReader_.joinable()) stdoutReader_.join();
    if (stderrReader_.joinable()) stderrReader_.join();
}

WriteStatus Process::write(const std::string& data, Deadline deadline,
                           const std::atomic<bool>* interrupt) noexcept {
    if (stdinFd_ < 0) {
        return WriteStatus::Broken;
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(stdinFd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return WriteStatus::TimedOut;
            }
            if (interrupt && interrupt->load()) {
                return WriteStatus::Interrupted;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            pollfd pfd{stdinFd_, POLLOUT, 0};
            ::poll(&pfd, 1, static_cast<int>(std::min<long long>(left + 1, 100)));
            continue;
        }
        return WriteStatus::Broken;
    }
    return WriteStatus::Ok;
}

void Process::closeStdin() noexcept {
    closeFd(stdinFd_);
}

void Process::recordStatus(int status) noexcept {
    reaped_ = true;
    exitCode_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool Process::exited() noexcept {
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        recordStatus(status);
        return true;
    }
    if (r < 0 && errno != EINTR) {
        // ECHILD: somebody else reaped it
        reaped_ = true;
        return true;
    }
    return false;
}

void Process::kill() noexcept {
    if (reaped_ || pid_ <= 0) {
        return;
    }
    ::kill(-pid_, SIGKILL);
    ::kill(pid_, SIGKILL);
    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    reaped_ = true;
    exitCode_ = -1;
    LOG_DEBUG("Killed pid " + std::to_string(pid_));
}

std::string Process::output() {
    if (reaped_) {
        joinReaders();
    }
    std::lock_guard<std::mutex> lock(outputMutex_);
    return stdout_;
}

std::string Process::errors() {
    if (reaped_) {
        joinReaders();
    }
    std::lock_guard<std::mutex> lock(outputMutex_);
    return stderr_;
}

} // namespace hashbreaker
