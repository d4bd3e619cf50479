#ifndef REPLAY_BRIDGE_FATAL_ERROR_HPP
#define REPLAY_BRIDGE_FATAL_ERROR_HPP

#include <stdexcept>
#include <string>

// Raised when the bridge can no longer trust its view of the native debugger
// or its environment. Never caught inside the core; main() reports it once
// and exits.
class FatalError : public std::runtime_error {
public:
    FatalError(const std::string& operation,
               const std::string& message,
               const char* file = nullptr,
               int line = 0);

    const std::string& getOperation() const { return operation; }
    // "file.cpp:123" of the raising call, or empty when unknown
    const std::string& getLocation() const { return location; }

    std::string describe() const;

private:
    std::string operation;
    std::string location;
};

#define REPLAY_BRIDGE_FATAL(operation, message) \
    throw FatalError((operation), (message), __FILE__, __LINE__)

#endif // REPLAY_BRIDGE_FATAL_ERROR_HPP
