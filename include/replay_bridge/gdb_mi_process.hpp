#ifndef REPLAY_BRIDGE_GDB_MI_PROCESS_HPP
#define REPLAY_BRIDGE_GDB_MI_PROCESS_HPP

#include "child_process.hpp"
#include "mi_channel.hpp"
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// gdb running with --interpreter=mi2 in a child process. A reader thread
// routes result records back to the blocked send() call with the same token
// and async records to the notification handler.
class GdbMiProcess : public MiChannel {
public:
    GdbMiProcess() = default;
    ~GdbMiProcess() override;

    GdbMiProcess(const GdbMiProcess&) = delete;
    GdbMiProcess& operator=(const GdbMiProcess&) = delete;

    // Throws MiTransportError if gdb cannot be started
    void start(const std::string& gdbExecutable, const std::vector<std::string>& extraArgs = {});

    MiRecord send(const std::string& command, const std::vector<std::string>& args) override;
    void setNotificationHandler(NotificationHandler handler) override;
    void setCloseHandler(CloseHandler handler) override;

private:
    ChildProcess process;
    std::thread readerThread;

    std::mutex mutex;
    std::condition_variable responseReady;
    std::map<long, MiRecord> responses;
    long nextToken{1};
    bool closed{false};
    NotificationHandler notificationHandler;
    CloseHandler closeHandler;

    void readLoop();
};

#endif // REPLAY_BRIDGE_GDB_MI_PROCESS_HPP
