#ifndef REPLAY_BRIDGE_COMMAND_DISPATCHER_HPP
#define REPLAY_BRIDGE_COMMAND_DISPATCHER_HPP

#include "dbgp_codec.hpp"
#include "execution_controller.hpp"
#include "native_debugger.hpp"
#include "session_state.hpp"
#include <functional>
#include <map>
#include <set>
#include <string>

class IdeChannel;

// Reads DBGp commands from the IDE, runs them against the native debugger
// and answers each with one framed response
class CommandDispatcher {
public:
    using Handler = std::function<std::string(const DbgpCommand&, Verbosity)>;

    CommandDispatcher(SessionState& session, IdeChannel& ide, NativeDebugger& debugger,
                      std::set<std::string> noisyCommands = {});

    // Until stop/detach or the IDE hangs up. FatalError propagates.
    void run();

    // One command line in, one response payload out (unframed). Empty when
    // the line carried no command.
    std::string handleLine(const std::string& line);

    bool isFinished() const { return finished; }
    bool hasHandler(const std::string& command) const { return handlers.count(command) > 0; }

private:
    SessionState& session;
    IdeChannel& ide;
    NativeDebugger& debugger;
    ExecutionController controller;
    std::set<std::string> noisyCommands;
    std::map<std::string, Handler> handlers;
    bool finished{false};

    void registerHandlers();

    std::string cmdStatus(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdFeatureGet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdFeatureSet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdBreakpointSet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdBreakpointGet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdBreakpointList(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdBreakpointUpdate(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdBreakpointRemove(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdRun(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdStep(const DbgpCommand& cmd, StepKind kind, Verbosity verbosity);
    std::string cmdStackDepth(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdStackGet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdContextNames(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdContextGet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdPropertyGet(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdPropertyValue(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdEval(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdStop(const DbgpCommand& cmd, Verbosity verbosity);
    std::string cmdDetach(const DbgpCommand& cmd, Verbosity verbosity);

    // Helper methods
    std::string continuationResponse(const DbgpCommand& cmd, const StopResult& stop);
    std::string breakpointElement(const BreakpointRegistry::Breakpoint& bp) const;
    const BreakpointRegistry::Breakpoint& requireBreakpoint(const DbgpCommand& cmd) const;
    std::string evaluateProperty(const DbgpCommand& cmd, const std::string& expression,
                                 int errorCode, Verbosity verbosity);
    void selectDepth(const DbgpCommand& cmd, Verbosity verbosity);
};

// Decimal option value; DbgpError (invalid options) if it is not one
int requireIntOption(const DbgpCommand& cmd, const std::string& flag);

#endif // REPLAY_BRIDGE_COMMAND_DISPATCHER_HPP
