#include "replay_bridge/child_process.hpp"
#include "logger.hpp"
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

ChildProcess::~ChildProcess() {
    closeInput();
    if (pid > 0) {
        terminate(SIGTERM);
        wait();
    }
    if (stdoutFd >= 0) {
        ::close(stdoutFd);
    }
}

bool ChildProcess::spawn(const std::vector<std::string>& argv, bool mergeStderr) {
    if (argv.empty() || pid > 0) return false;

    // Close-on-exec so a later child (gdb) does not hold an earlier one's
    // (rr's) pipes open; dup2 clears the flag on the child's 0, 1 and 2
    int stdinPipe[2], stdoutPipe[2];
    if (pipe2(stdinPipe, O_CLOEXEC) < 0) {
        LOG_ERROR("pipe: ", std::strerror(errno));
        return false;
    }
    if (pipe2(stdoutPipe, O_CLOEXEC) < 0) {
        LOG_ERROR("pipe: ", std::strerror(errno));
        ::close(stdinPipe[0]); ::close(stdinPipe[1]);
        return false;
    }

    std::vector<char*> args;
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid = fork();
    if (pid < 0) {
        LOG_ERROR("fork: ", std::strerror(errno));
        ::close(stdinPipe[0]); ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]); ::close(stdoutPipe[1]);
        return false;
    }

    if (pid == 0) {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        dup2(stdinPipe[0], STDIN_FILENO);
        dup2(stdoutPipe[1], STDOUT_FILENO);
        if (mergeStderr) {
            dup2(stdoutPipe[1], STDERR_FILENO);
        }
        ::close(stdinPipe[0]);
        ::close(stdoutPipe[1]);

        execvp(args[0], args.data());
        std::perror("execvp");
        _exit(127);
    }

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    stdinFd = stdinPipe[1];
    stdoutFd = stdoutPipe[0];
    LOG_DEBUG("Spawned ", argv[0], " as pid ", pid);
    return true;
}

bool ChildProcess::writeAll(const std::string& data) {
    if (stdinFd < 0) return false;
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(stdinFd, data.data() + off, data.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += static_cast<size_t>(n);
    }
    return true;
}

bool ChildProcess::readLine(std::string& line) {
    if (stdoutFd < 0) return false;
    while (true) {
        auto newline = readBuffer.find('\n');
        if (newline != std::string::npos) {
            line = readBuffer.substr(0, newline);
            readBuffer.erase(0, newline + 1);
            return true;
        }

        char chunk[4096];
        ssize_t n = ::read(stdoutFd, chunk, sizeof(chunk));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            if (readBuffer.empty()) return false;
            line = std::move(readBuffer);
            readBuffer.clear();
            return true;
        }
        readBuffer.append(chunk, static_cast<size_t>(n));
    }
}

void ChildProcess::closeInput() {
    if (stdinFd >= 0) {
        ::close(stdinFd);
        stdinFd = -1;
    }
}

void ChildProcess::terminate(int signal) {
    if (pid > 0) {
        ::kill(pid, signal);
    }
}

int ChildProcess::wait() {
    if (pid <= 0) return -1;
    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    pid = -1;
    if (result < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}
