#ifndef REPLAY_BRIDGE_MI_CHANNEL_HPP
#define REPLAY_BRIDGE_MI_CHANNEL_HPP

#include "mi_record.hpp"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// The native debugger went away or stopped answering
class MiTransportError : public std::runtime_error {
public:
    explicit MiTransportError(const std::string& message) : std::runtime_error(message) {}
};

// Request/response transport to a gdb/MI speaking native debugger
class MiChannel {
public:
    using NotificationHandler = std::function<void(const MiRecord&)>;
    using CloseHandler = std::function<void()>;

    virtual ~MiChannel() = default;

    // Sends "-command args..." and blocks until its result record arrives.
    // Throws MiTransportError when the channel is broken.
    virtual MiRecord send(const std::string& command, const std::vector<std::string>& args) = 0;

    // Called with every async record (*stopped, =breakpoint-modified, ...),
    // on whatever thread reads the native debugger's output.
    virtual void setNotificationHandler(NotificationHandler handler) = 0;

    // Called once when the native debugger's output ends
    virtual void setCloseHandler(CloseHandler handler) = 0;
};

#endif // REPLAY_BRIDGE_MI_CHANNEL_HPP
