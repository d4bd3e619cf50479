#ifndef REPLAY_BRIDGE_STOP_NOTIFIER_HPP
#define REPLAY_BRIDGE_STOP_NOTIFIER_HPP

#include "mi_record.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

// Why execution halted: the native breakpoint number, or the native stop
// reason (end-stepping-range, no-history, ...) when no breakpoint was hit.
struct StopEvent {
    std::string id;
    std::string filename;
    int line{0};

    StopEvent() = default;
    StopEvent(std::string i, std::string f = "", int l = 0)
        : id(std::move(i)), filename(std::move(f)), line(l) {}
};

// Capacity-1 rendezvous between the gdb reader thread and the one execution
// command waiting for its stop. Armed once per command.
class StopNotifier {
public:
    // Must precede issuing the execution command. Arming twice throws
    // std::logic_error.
    void arm();

    // Called from the reader thread. Returns false (and logs) when nobody is
    // armed or the slot is already taken; the event is dropped.
    bool post(StopEvent event);

    // Blocks until the armed slot is filled, then disarms. Throws FatalError
    // once the notifier is closed with nothing in the slot.
    StopEvent wait();

    // Drops an arming whose execution command was refused
    void disarm();

    // The native debugger is gone: no stop will ever be posted again
    void close();

    bool isArmed() const;

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool armed{false};
    bool closed{false};
    std::optional<StopEvent> slot;
};

// Turns a *stopped record into a StopEvent; nullopt for any other record
std::optional<StopEvent> stopEventFromRecord(const MiRecord& record);

#endif // REPLAY_BRIDGE_STOP_NOTIFIER_HPP
