#include "replay_bridge/execution_controller.hpp"
#include "replay_bridge/dbgp_codec.hpp"
#include "logger.hpp"

const char* execCommandFor(StepKind kind) {
    switch (kind) {
        case StepKind::INTO: return "exec-step";
        case StepKind::OVER: return "exec-next";
        case StepKind::OUT:  return "exec-finish";
    }
    return "exec-step";
}

StopResult ExecutionController::continueExecution(bool reverse, Verbosity verbosity) {
    return execute("exec-continue", reverse, verbosity);
}

StopResult ExecutionController::step(StepKind kind, bool reverse, Verbosity verbosity) {
    return execute(execCommandFor(kind), reverse, verbosity);
}

StopResult ExecutionController::execute(const std::string& execCommand, bool reverse, Verbosity verbosity) {
    SessionStatus previous = session.status.load();
    session.status = SessionStatus::RUNNING;

    // The stop can arrive before resume() returns
    session.notifier.arm();
    std::string error;
    if (!debugger.resume(execCommand, reverse, error, verbosity)) {
        session.notifier.disarm();
        session.status = previous;
        throw DbgpError(DBGP_E_NOT_AVAILABLE, error);
    }

    StopEvent event = session.notifier.wait();
    session.status = SessionStatus::BREAK;

    LOG_DEBUG(execCommand, reverse ? " (reverse)" : "", " stopped: ", event.id,
              event.filename.empty() ? "" : " at ", event.filename,
              event.filename.empty() ? "" : ":" + std::to_string(event.line));
    return classify(event);
}

StopResult ExecutionController::classify(const StopEvent& event) {
    StopResult result;
    result.breakpointId = event.id;
    result.filename = event.filename;
    result.lineno = event.line;

    auto& breakpoints = session.breakpoints;
    if (breakpoints.isEnabledTemporaryBreakpoint(event.id)) {
        // gdb already deleted its side (disp=del)
        breakpoints.removeBreakpoint(event.id);
        result.breakpointHit = true;
    } else if (breakpoints.isEnabledBreakpoint(event.id)) {
        breakpoints.recordHit(event.id);
        result.breakpointHit = true;
    }
    return result;
}
