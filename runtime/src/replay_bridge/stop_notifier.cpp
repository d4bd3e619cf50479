#include "replay_bridge/stop_notifier.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <stdexcept>

void StopNotifier::arm() {
    std::lock_guard<std::mutex> lock(mutex);
    if (armed) {
        throw std::logic_error("stop notifier armed twice");
    }
    armed = true;
    slot.reset();
}

bool StopNotifier::post(StopEvent event) {
    std::lock_guard<std::mutex> lock(mutex);
    if (!armed) {
        LOG_DEBUG("Dropping stop '", event.id, "': no execution command is waiting");
        return false;
    }
    if (slot) {
        LOG_WARNING("Dropping stop '", event.id, "': already holding '", slot->id, "'");
        return false;
    }
    slot = std::move(event);
    cv.notify_one();
    return true;
}

StopEvent StopNotifier::wait() {
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this] { return closed || (armed && slot.has_value()); });

    if (!slot) {
        armed = false;
        REPLAY_BRIDGE_FATAL("wait for stop", "gdb exited while the replay was running");
    }
    StopEvent event = std::move(*slot);
    slot.reset();
    armed = false;
    return event;
}

void StopNotifier::disarm() {
    std::lock_guard<std::mutex> lock(mutex);
    armed = false;
    slot.reset();
}

void StopNotifier::close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
    cv.notify_all();
}

bool StopNotifier::isArmed() const {
    std::lock_guard<std::mutex> lock(mutex);
    return armed;
}

std::optional<StopEvent> stopEventFromRecord(const MiRecord& record) {
    if (record.kind != MiRecord::Kind::EXEC_ASYNC || record.recordClass != "stopped") {
        return std::nullopt;
    }

    StopEvent event;
    event.id = record.payload.getString("bkptno");
    if (event.id.empty()) {
        event.id = record.payload.getString("reason", "unknown");
    }

    if (const MiValue* frame = record.payload.find("frame")) {
        event.filename = frame->getString("fullname", frame->getString("file"));
        event.line = std::atoi(frame->getString("line", "0").c_str());
    }
    return event;
}
