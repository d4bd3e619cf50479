#include "replay_bridge/command_dispatcher.hpp"
#include "replay_bridge/ide_connection.hpp"
#include "logger.hpp"
#include <sstream>

namespace {

void traceTraffic(Verbosity verbosity, const std::string& line) {
    if (verbosity == Verbosity::NOISY) {
        Logger::write(LogLevel::INFO, line);
    } else {
        LOG_DEBUG(line);
    }
}

std::string propertyElement(const std::string& name, const std::string& type, const std::string& value) {
    std::ostringstream ss;
    ss << "<property";
    if (!name.empty()) {
        ss << " name=\"" << xmlEscape(name) << "\" fullname=\"" << xmlEscape(name) << "\"";
    }
    ss << " type=\"" << xmlEscape(type) << "\""
       << " children=\"0\" encoding=\"base64\" size=\"" << value.size() << "\">"
       << "<![CDATA[" << base64Encode(value) << "]]></property>";
    return ss.str();
}

bool isExitReason(const std::string& reason) {
    return reason.compare(0, 6, "exited") == 0;
}

}

int requireIntOption(const DbgpCommand& cmd, const std::string& flag) {
    std::string text = cmd.option(flag);
    int value = 0;
    if (!parseDecimalInt(text, value)) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "Option -" + flag + " needs a number, got '" + text + "'");
    }
    return value;
}

CommandDispatcher::CommandDispatcher(SessionState& session, IdeChannel& ide, NativeDebugger& debugger,
                                     std::set<std::string> noisyCommands)
    : session(session), ide(ide), debugger(debugger), controller(session, debugger),
      noisyCommands(std::move(noisyCommands)) {
    registerHandlers();
}

void CommandDispatcher::registerHandlers() {
    handlers["status"] = [this](const auto& cmd, auto v) { return cmdStatus(cmd, v); };
    handlers["feature_get"] = [this](const auto& cmd, auto v) { return cmdFeatureGet(cmd, v); };
    handlers["feature_set"] = [this](const auto& cmd, auto v) { return cmdFeatureSet(cmd, v); };
    handlers["breakpoint_set"] = [this](const auto& cmd, auto v) { return cmdBreakpointSet(cmd, v); };
    handlers["breakpoint_get"] = [this](const auto& cmd, auto v) { return cmdBreakpointGet(cmd, v); };
    handlers["breakpoint_list"] = [this](const auto& cmd, auto v) { return cmdBreakpointList(cmd, v); };
    handlers["breakpoint_update"] = [this](const auto& cmd, auto v) { return cmdBreakpointUpdate(cmd, v); };
    handlers["breakpoint_remove"] = [this](const auto& cmd, auto v) { return cmdBreakpointRemove(cmd, v); };
    handlers["run"] = [this](const auto& cmd, auto v) { return cmdRun(cmd, v); };
    handlers["step_into"] = [this](const auto& cmd, auto v) { return cmdStep(cmd, StepKind::INTO, v); };
    handlers["step_over"] = [this](const auto& cmd, auto v) { return cmdStep(cmd, StepKind::OVER, v); };
    handlers["step_out"] = [this](const auto& cmd, auto v) { return cmdStep(cmd, StepKind::OUT, v); };
    handlers["stack_depth"] = [this](const auto& cmd, auto v) { return cmdStackDepth(cmd, v); };
    handlers["stack_get"] = [this](const auto& cmd, auto v) { return cmdStackGet(cmd, v); };
    handlers["context_names"] = [this](const auto& cmd, auto v) { return cmdContextNames(cmd, v); };
    handlers["context_get"] = [this](const auto& cmd, auto v) { return cmdContextGet(cmd, v); };
    handlers["property_get"] = [this](const auto& cmd, auto v) { return cmdPropertyGet(cmd, v); };
    handlers["property_value"] = [this](const auto& cmd, auto v) { return cmdPropertyValue(cmd, v); };
    handlers["eval"] = [this](const auto& cmd, auto v) { return cmdEval(cmd, v); };
    handlers["stop"] = [this](const auto& cmd, auto v) { return cmdStop(cmd, v); };
    handlers["detach"] = [this](const auto& cmd, auto v) { return cmdDetach(cmd, v); };
}

void CommandDispatcher::run() {
    std::string line;
    while (!finished && ide.readCommand(line)) {
        std::string payload = handleLine(line);
        if (payload.empty()) {
            continue;
        }
        if (!ide.writePacket(constructPacket(payload))) {
            LOG_WARNING("Could not send the response to the IDE; ending the session");
            break;
        }
    }
    LOG_INFO("Debugging session ended (status ", toString(session.status.load()), ")");
}

std::string CommandDispatcher::handleLine(const std::string& line) {
    DbgpCommand cmd = parseCommand(line, session.reverseMode.load());
    session.lastSequenceNum = cmd.seqNum;
    if (cmd.command.empty()) {
        return "";
    }

    Verbosity verbosity = noisyCommands.count(cmd.command) ? Verbosity::NOISY : Verbosity::AMBIENT;
    traceTraffic(verbosity, "ide -> bridge: " + line);

    std::string payload;
    auto it = handlers.find(cmd.command);
    try {
        if (it == handlers.end()) {
            throw DbgpError(DBGP_E_UNIMPLEMENTED, "Unimplemented command: " + cmd.command);
        }
        payload = it->second(cmd, verbosity);
    } catch (const DbgpError& e) {
        LOG_WARNING(cmd.command, " failed (", e.getCode(), "): ", e.what());
        payload = errorResponse(cmd.command, cmd.seqNum, e.getCode(), e.what());
    }

    traceTraffic(verbosity, "bridge -> ide: " + payload);
    return payload;
}

std::string CommandDispatcher::cmdStatus(const DbgpCommand& cmd, Verbosity) {
    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("status", toString(session.status.load()))
        .attribute("reason", toString(session.reason))
        .str();
}

std::string CommandDispatcher::cmdFeatureGet(const DbgpCommand& cmd, Verbosity) {
    std::string name = cmd.option("n");
    if (name.empty()) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "feature_get needs -n");
    }

    DbgpResponse response(cmd.command, cmd.seqNum);
    response.attribute("feature_name", name);

    auto it = session.featureMap.find(name);
    if (it != session.featureMap.end()) {
        response.attribute("supported", 1).child(xmlEscape(it->second.value));
    } else if (hasHandler(name)) {
        response.attribute("supported", 1).child("1");
    } else {
        response.attribute("supported", 0);
    }
    return response.str();
}

std::string CommandDispatcher::cmdFeatureSet(const DbgpCommand& cmd, Verbosity) {
    std::string name = cmd.option("n");
    if (name.empty() || !cmd.hasOption("v")) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "feature_set needs -n and -v");
    }

    bool success = false;
    auto it = session.featureMap.find(name);
    if (it != session.featureMap.end() && !it->second.readOnly) {
        it->second.value = cmd.option("v");
        success = true;
    }

    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("feature", name)
        .attribute("success", success ? 1 : 0)
        .str();
}

std::string CommandDispatcher::cmdBreakpointSet(const DbgpCommand& cmd, Verbosity verbosity) {
    std::string type = cmd.option("t", "line");
    BreakpointRegistry::Breakpoint bp;
    if (type == "line") {
        bp.type = BreakpointRegistry::Type::LINE;
    } else if (type == "conditional") {
        bp.type = BreakpointRegistry::Type::CONDITIONAL;
    } else {
        throw DbgpError(DBGP_E_BREAKPOINT_TYPE, "Breakpoint type " + type + " is not supported");
    }

    if (!cmd.hasOption("f") || !cmd.hasOption("n")) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "breakpoint_set needs -f and -n");
    }
    bp.filename = cmd.option("f");
    bp.lineno = requireIntOption(cmd, "n");
    bp.enabled = cmd.option("s", "enabled") != "disabled";
    bp.temporary = cmd.option("r") == "1";
    if (cmd.hasOption("h")) bp.hitValue = requireIntOption(cmd, "h");
    bp.hitCondition = cmd.option("o");

    if (cmd.hasOption("-")) {
        bp.expression = base64Decode(cmd.option("-"));
    }
    if (bp.type == BreakpointRegistry::Type::CONDITIONAL && bp.expression.empty()) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "A conditional breakpoint needs an expression");
    }

    std::string path = fileUriToPath(bp.filename);
    std::string location = path + ":" + std::to_string(bp.lineno);

    NativeBreakpoint native;
    std::string error;
    if (!debugger.insertBreakpoint(location, bp.temporary, !bp.enabled, bp.expression, native, error, verbosity)) {
        throw DbgpError(DBGP_E_BREAKPOINT_NOT_SET, error);
    }

    session.sourceId(path);
    bp.nativeRef = native.number;
    std::string state = bp.enabled ? "enabled" : "disabled";
    if (!session.breakpoints.addBreakpoint(bp)) {
        throw DbgpError(DBGP_E_BREAKPOINT_NOT_SET, "Breakpoint " + native.number + " is already registered");
    }

    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("state", state)
        .attribute("id", native.number)
        .str();
}

const BreakpointRegistry::Breakpoint& CommandDispatcher::requireBreakpoint(const DbgpCommand& cmd) const {
    std::string id = cmd.option("d");
    const BreakpointRegistry::Breakpoint* bp = session.breakpoints.getBreakpoint(id);
    if (!bp) {
        throw DbgpError(DBGP_E_NO_SUCH_BREAKPOINT, "No such breakpoint: " + id);
    }
    return *bp;
}

std::string CommandDispatcher::breakpointElement(const BreakpointRegistry::Breakpoint& bp) const {
    std::ostringstream ss;
    ss << "<breakpoint id=\"" << xmlEscape(bp.id) << "\""
       << " type=\"" << BreakpointRegistry::typeName(bp.type) << "\""
       << " state=\"" << (bp.enabled ? "enabled" : "disabled") << "\""
       << " filename=\"" << xmlEscape(bp.filename) << "\""
       << " lineno=\"" << bp.lineno << "\""
       << " temporary=\"" << (bp.temporary ? 1 : 0) << "\""
       << " hit_count=\"" << bp.hitCount << "\""
       << " hit_value=\"" << bp.hitValue << "\"";
    if (!bp.hitCondition.empty()) {
        ss << " hit_condition=\"" << xmlEscape(bp.hitCondition) << "\"";
    }

    if (bp.expression.empty()) {
        ss << "/>";
    } else {
        ss << "><expression>" << xmlEscape(bp.expression) << "</expression></breakpoint>";
    }
    return ss.str();
}

std::string CommandDispatcher::cmdBreakpointGet(const DbgpCommand& cmd, Verbosity) {
    const auto& bp = requireBreakpoint(cmd);
    return DbgpResponse(cmd.command, cmd.seqNum).child(breakpointElement(bp)).str();
}

std::string CommandDispatcher::cmdBreakpointList(const DbgpCommand& cmd, Verbosity) {
    DbgpResponse response(cmd.command, cmd.seqNum);
    for (const auto& bp : session.breakpoints.getAllBreakpoints()) {
        response.child(breakpointElement(bp));
    }
    return response.str();
}

std::string CommandDispatcher::cmdBreakpointUpdate(const DbgpCommand& cmd, Verbosity verbosity) {
    const auto& existing = requireBreakpoint(cmd);
    std::string id = existing.id;

    if (cmd.hasOption("n") && requireIntOption(cmd, "n") != existing.lineno) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "Moving breakpoint " + id + " to another line is not supported");
    }

    int hitValue = cmd.hasOption("h") ? requireIntOption(cmd, "h") : existing.hitValue;

    if (cmd.hasOption("s")) {
        std::string state = cmd.option("s");
        if (state != "enabled" && state != "disabled") {
            throw DbgpError(DBGP_E_INVALID_OPTIONS, "Unknown breakpoint state: " + state);
        }
        bool enable = state == "enabled";
        std::string error;
        if (!debugger.enableBreakpoint(existing.nativeRef, enable, error, verbosity)) {
            throw DbgpError(DBGP_E_BREAKPOINT_NOT_SET, error);
        }
        session.breakpoints.setEnabled(id, enable);
    }

    BreakpointRegistry::Breakpoint* bp = session.breakpoints.getBreakpoint(id);
    bp->hitValue = hitValue;
    if (cmd.hasOption("o")) {
        bp->hitCondition = cmd.option("o");
    }

    return DbgpResponse(cmd.command, cmd.seqNum).str();
}

std::string CommandDispatcher::cmdBreakpointRemove(const DbgpCommand& cmd, Verbosity verbosity) {
    const auto& bp = requireBreakpoint(cmd);
    std::string id = bp.id;
    std::string element = breakpointElement(bp);

    std::string error;
    if (!debugger.deleteBreakpoint(bp.nativeRef, error, verbosity)) {
        throw DbgpError(DBGP_E_NO_SUCH_BREAKPOINT, error);
    }
    session.breakpoints.removeBreakpoint(id);

    return DbgpResponse(cmd.command, cmd.seqNum).child(element).str();
}

std::string CommandDispatcher::continuationResponse(const DbgpCommand& cmd, const StopResult& stop) {
    if (isExitReason(stop.breakpointId)) {
        session.status = SessionStatus::STOPPING;
    }

    DbgpResponse response(cmd.command, cmd.seqNum);
    response.attribute("status", toString(session.status.load()))
            .attribute("reason", toString(session.reason));

    if (!stop.filename.empty()) {
        session.sourceId(stop.filename);
        std::ostringstream message;
        message << "<xdebug:message filename=\"" << xmlEscape(pathToFileUri(stop.filename)) << "\""
                << " lineno=\"" << stop.lineno << "\"></xdebug:message>";
        response.child(message.str());
    }
    return response.str();
}

std::string CommandDispatcher::cmdRun(const DbgpCommand& cmd, Verbosity verbosity) {
    StopResult stop = controller.continueExecution(cmd.reverse, verbosity);
    if (stop.breakpointHit) {
        LOG_INFO("Stopped at breakpoint ", stop.breakpointId,
                 cmd.reverse ? " (reverse)" : "");
    } else {
        LOG_DEBUG("Stopped without a breakpoint: ", stop.breakpointId);
    }
    return continuationResponse(cmd, stop);
}

std::string CommandDispatcher::cmdStep(const DbgpCommand& cmd, StepKind kind, Verbosity verbosity) {
    return continuationResponse(cmd, controller.step(kind, cmd.reverse, verbosity));
}

std::string CommandDispatcher::cmdStackDepth(const DbgpCommand& cmd, Verbosity verbosity) {
    session.maxStackDepth = debugger.stackDepth(verbosity);
    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("depth", session.maxStackDepth)
        .str();
}

std::string CommandDispatcher::cmdStackGet(const DbgpCommand& cmd, Verbosity verbosity) {
    std::vector<NativeFrame> frames = debugger.listFrames(verbosity);

    session.levelAr.clear();
    for (const auto& frame : frames) {
        session.levelAr.push_back(frame.level);
    }
    session.maxStackDepth = static_cast<int>(frames.size());

    int only = -1;
    if (cmd.hasOption("d")) {
        only = requireIntOption(cmd, "d");
        if (only < 0 || only >= static_cast<int>(frames.size())) {
            throw DbgpError(DBGP_E_STACK_DEPTH, "No stack frame at depth " + cmd.option("d"));
        }
    }

    DbgpResponse response(cmd.command, cmd.seqNum);
    for (const auto& frame : frames) {
        if (only >= 0 && frame.level != only) continue;
        if (!frame.fullname.empty()) session.sourceId(frame.fullname);

        std::ostringstream element;
        element << "<stack level=\"" << frame.level << "\" type=\"file\""
                << " filename=\"" << xmlEscape(pathToFileUri(frame.fullname)) << "\""
                << " lineno=\"" << frame.line << "\""
                << " where=\"" << xmlEscape(frame.function) << "\"/>";
        response.child(element.str());
    }
    return response.str();
}

std::string CommandDispatcher::cmdContextNames(const DbgpCommand& cmd, Verbosity) {
    return DbgpResponse(cmd.command, cmd.seqNum)
        .child("<context name=\"Locals\" id=\"0\"/>")
        .str();
}

void CommandDispatcher::selectDepth(const DbgpCommand& cmd, Verbosity verbosity) {
    int depth = cmd.hasOption("d") ? requireIntOption(cmd, "d") : 0;
    if (depth < 0 || !debugger.selectFrame(depth, verbosity)) {
        throw DbgpError(DBGP_E_STACK_DEPTH, "No stack frame at depth " + std::to_string(depth));
    }
}

std::string CommandDispatcher::cmdContextGet(const DbgpCommand& cmd, Verbosity verbosity) {
    if (cmd.hasOption("c") && cmd.option("c") != "0") {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "Unknown context " + cmd.option("c"));
    }
    selectDepth(cmd, verbosity);

    DbgpResponse response(cmd.command, cmd.seqNum);
    response.attribute("context", 0);
    for (const auto& variable : debugger.listVariables(verbosity)) {
        response.child(propertyElement(variable.name, variable.type, variable.value));
    }
    return response.str();
}

std::string CommandDispatcher::evaluateProperty(const DbgpCommand& cmd, const std::string& expression,
                                                int errorCode, Verbosity verbosity) {
    selectDepth(cmd, verbosity);
    EvalResult result = debugger.evaluate(expression, EvalKind::VALUE, verbosity);
    if (auto* error = std::get_if<EvalError>(&result)) {
        throw DbgpError(errorCode, error->message);
    }
    return std::get<EvalString>(result).value;
}

std::string CommandDispatcher::cmdPropertyGet(const DbgpCommand& cmd, Verbosity verbosity) {
    std::string name = cmd.option("n");
    if (name.empty()) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "property_get needs -n");
    }
    std::string value = evaluateProperty(cmd, name, DBGP_E_PROPERTY, verbosity);
    return DbgpResponse(cmd.command, cmd.seqNum)
        .child(propertyElement(name, "string", value))
        .str();
}

std::string CommandDispatcher::cmdPropertyValue(const DbgpCommand& cmd, Verbosity verbosity) {
    std::string name = cmd.option("n");
    if (name.empty()) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "property_value needs -n");
    }
    std::string value = evaluateProperty(cmd, name, DBGP_E_PROPERTY, verbosity);
    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("size", static_cast<int>(value.size()))
        .attribute("encoding", "base64")
        .child("<![CDATA[" + base64Encode(value) + "]]>")
        .str();
}

std::string CommandDispatcher::cmdEval(const DbgpCommand& cmd, Verbosity verbosity) {
    std::string expression = base64Decode(cmd.option("-"));
    if (expression.empty()) {
        throw DbgpError(DBGP_E_INVALID_OPTIONS, "eval needs a base64 expression after --");
    }
    std::string value = evaluateProperty(cmd, expression, DBGP_E_EVALUATION, verbosity);
    return DbgpResponse(cmd.command, cmd.seqNum)
        .child(propertyElement("", "string", value))
        .str();
}

std::string CommandDispatcher::cmdStop(const DbgpCommand& cmd, Verbosity) {
    session.status = SessionStatus::STOPPED;
    session.reason = SessionReason::OK;
    finished = true;
    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("status", toString(session.status.load()))
        .attribute("reason", toString(session.reason))
        .str();
}

std::string CommandDispatcher::cmdDetach(const DbgpCommand& cmd, Verbosity) {
    session.status = SessionStatus::STOPPING;
    session.reason = SessionReason::OK;
    finished = true;
    return DbgpResponse(cmd.command, cmd.seqNum)
        .attribute("status", toString(session.status.load()))
        .attribute("reason", toString(session.reason))
        .str();
}
