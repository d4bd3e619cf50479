#ifndef REPLAY_BRIDGE_IDE_CONNECTION_HPP
#define REPLAY_BRIDGE_IDE_CONNECTION_HPP

#include <atomic>
#include <string>

// Transport to the IDE. Commands arrive NUL-terminated; packets go out
// already framed.
class IdeChannel {
public:
    virtual ~IdeChannel() = default;

    // Blocks for the next command line. False once the IDE hung up or the
    // channel was closed.
    virtual bool readCommand(std::string& command) = 0;
    virtual bool writePacket(const std::string& packet) = 0;
    // Safe to call from another thread to unblock readCommand()
    virtual void close() = 0;
};

// DBGp engines connect out to the listening IDE
class SocketIdeChannel : public IdeChannel {
public:
    SocketIdeChannel() = default;
    ~SocketIdeChannel() override;

    SocketIdeChannel(const SocketIdeChannel&) = delete;
    SocketIdeChannel& operator=(const SocketIdeChannel&) = delete;

    // Returns false with the reason in error
    bool connectTo(const std::string& host, int port, std::string& error);

    bool readCommand(std::string& command) override;
    bool writePacket(const std::string& packet) override;
    void close() override;

private:
    std::atomic<int> fd{-1};
    std::string pending;    // bytes received after the last NUL
};

#endif // REPLAY_BRIDGE_IDE_CONNECTION_HPP
