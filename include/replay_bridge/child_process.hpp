#ifndef REPLAY_BRIDGE_CHILD_PROCESS_HPP
#define REPLAY_BRIDGE_CHILD_PROCESS_HPP

#include <string>
#include <sys/types.h>
#include <vector>

// A spawned program with its stdin and stdout/stderr connected to pipes
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    // argv[0] is the executable path. Returns false if the pipes or the
    // fork could not be created.
    bool spawn(const std::vector<std::string>& argv, bool mergeStderr = true);

    bool writeAll(const std::string& data);
    // Reads one '\n' terminated line (without the terminator). False on EOF.
    bool readLine(std::string& line);

    void closeInput();
    void terminate(int signal);
    // Reaps the child; returns its exit status or -1
    int wait();

    bool isRunning() const { return pid > 0; }

private:
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    std::string readBuffer;
};

#endif // REPLAY_BRIDGE_CHILD_PROCESS_HPP
