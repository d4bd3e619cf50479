#ifndef REPLAY_BRIDGE_REPLAY_PROCESS_HPP
#define REPLAY_BRIDGE_REPLAY_PROCESS_HPP

#include "child_process.hpp"
#include <string>
#include <thread>

// An `rr replay -s <port>` gdbserver for one recorded trace
class ReplayProcess {
public:
    ReplayProcess() = default;
    ~ReplayProcess();

    ReplayProcess(const ReplayProcess&) = delete;
    ReplayProcess& operator=(const ReplayProcess&) = delete;

    // Spawns the replay and waits for it to announce where it listens.
    // An empty traceDir replays the latest recording. Failure is fatal.
    void start(const std::string& rrExecutable, int port, const std::string& traceDir);

    // e.g. ":9999", usable with target-select extended-remote
    const std::string& getAddress() const { return address; }

    void stop();

private:
    ChildProcess process;
    std::string address;
    std::thread drainThread;
};

// Extracts the address from a "target extended-remote <addr>" hint line,
// empty if the line does not carry one
std::string parseReplayAddress(const std::string& line);

#endif // REPLAY_BRIDGE_REPLAY_PROCESS_HPP
