#include "replay_bridge/replay_process.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "logger.hpp"
#include <csignal>

namespace {
const char* const REMOTE_HINT = "target extended-remote ";
}

std::string parseReplayAddress(const std::string& line) {
    auto pos = line.find(REMOTE_HINT);
    if (pos == std::string::npos) {
        return "";
    }
    pos += std::string(REMOTE_HINT).size();
    auto end = line.find_first_of("' \t\"", pos);
    return line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

ReplayProcess::~ReplayProcess() {
    stop();
}

void ReplayProcess::start(const std::string& rrExecutable, int port, const std::string& traceDir) {
    std::vector<std::string> argv = {rrExecutable, "replay", "-s", std::to_string(port)};
    if (!traceDir.empty()) {
        argv.push_back(traceDir);
    }

    if (!process.spawn(argv)) {
        REPLAY_BRIDGE_FATAL("rr replay", "Could not start " + rrExecutable);
    }
    LOG_INFO("Started rr replay on port ", port, traceDir.empty() ? "" : " for ", traceDir);

    std::string line;
    while (address.empty()) {
        if (!process.readLine(line)) {
            REPLAY_BRIDGE_FATAL("rr replay", "rr exited before announcing its gdbserver address");
        }
        LOG_DEBUG("rr: ", line);
        address = parseReplayAddress(line);
    }
    LOG_INFO("rr replay is listening at ", address);

    drainThread = std::thread([this] {
        std::string output;
        while (process.readLine(output)) {
            LOG_DEBUG("rr: ", output);
        }
        LOG_DEBUG("rr output closed");
    });
}

void ReplayProcess::stop() {
    if (process.isRunning()) {
        process.terminate(SIGTERM);
    }
    if (drainThread.joinable()) {
        drainThread.join();
    }
    process.wait();
}
