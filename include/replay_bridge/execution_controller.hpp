#ifndef REPLAY_BRIDGE_EXECUTION_CONTROLLER_HPP
#define REPLAY_BRIDGE_EXECUTION_CONTROLLER_HPP

#include "native_debugger.hpp"
#include "session_state.hpp"
#include <string>

enum class StepKind {
    INTO,
    OVER,
    OUT
};

struct StopResult {
    std::string breakpointId;   // breakpoint number or native stop reason
    bool breakpointHit{false};
    std::string filename;
    int lineno{0};
};

// Resumes the replay in either direction and waits for the one stop that
// follows. The only writer of the running and break states. A resume gdb
// refuses leaves the status as it was and throws DbgpError.
class ExecutionController {
public:
    ExecutionController(SessionState& session, NativeDebugger& debugger)
        : session(session), debugger(debugger) {}

    StopResult continueExecution(bool reverse, Verbosity verbosity = Verbosity::AMBIENT);
    StopResult step(StepKind kind, bool reverse, Verbosity verbosity = Verbosity::AMBIENT);

private:
    SessionState& session;
    NativeDebugger& debugger;

    StopResult execute(const std::string& execCommand, bool reverse, Verbosity verbosity);
    StopResult classify(const StopEvent& event);
};

const char* execCommandFor(StepKind kind);

#endif // REPLAY_BRIDGE_EXECUTION_CONTROLLER_HPP
