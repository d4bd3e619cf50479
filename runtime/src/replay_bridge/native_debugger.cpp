#include "replay_bridge/native_debugger.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "logger.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace {

const size_t TRACE_LIMIT = 300;

void traceLine(Verbosity verbosity, const std::string& line) {
    if (verbosity == Verbosity::NOISY) {
        Logger::write(LogLevel::INFO, line);
    } else {
        LOG_DEBUG(line);
    }
}

// gdb prints ints as an optional '-' and digits; anything else is not one
bool parseInt(const std::string& text, int& out) {
    size_t first = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (first >= text.size() || !std::isdigit(static_cast<unsigned char>(text[first]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += " ";
        joined += arg;
    }
    return joined;
}

}

MiRecord NativeDebugger::send(const std::string& command,
                              const std::vector<std::string>& args,
                              Verbosity verbosity) {
    if (verbosity == Verbosity::NOISY || Logger::isEnabled(LogLevel::DEBUG)) {
        traceLine(verbosity, "bridge -> gdb: " + command + " " + joinArgs(args));
    }

    MiRecord result;
    try {
        result = channel.send(command, args);
    } catch (const MiTransportError& e) {
        REPLAY_BRIDGE_FATAL(command, e.what());
    }

    if (verbosity == Verbosity::NOISY || Logger::isEnabled(LogLevel::DEBUG)) {
        std::string text = result.toString();
        std::string continued;
        if (text.size() > TRACE_LIMIT) {
            text.resize(TRACE_LIMIT);
            continued = "...";
        }
        traceLine(verbosity, "gdb -> bridge: " + text + continued);
    }
    return result;
}

MiRecord NativeDebugger::sendExpectingDone(const std::string& command,
                                           const std::vector<std::string>& args,
                                           Verbosity verbosity) {
    MiRecord result = send(command, args, verbosity);
    std::string commandWas = command + " " + joinArgs(args);
    if (result.recordClass.empty()) {
        REPLAY_BRIDGE_FATAL(command, "Could not execute the gdb/mi command: " + commandWas);
    }
    if (result.recordClass != "done") {
        REPLAY_BRIDGE_FATAL(command, "Not completed the gdb/mi command: " + commandWas +
                            " (" + result.payload.getString("msg", result.recordClass) + ")");
    }
    return result;
}

EvalResult NativeDebugger::evaluate(const std::string& expression, EvalKind kind, Verbosity verbosity) {
    MiRecord result = send("data-evaluate-expression", {expression}, verbosity);
    std::string commandWas = "data-evaluate-expression " + expression;

    if (result.recordClass.empty()) {
        REPLAY_BRIDGE_FATAL("data-evaluate-expression", "Could not execute the gdb/mi command: " + commandWas);
    }
    if (result.recordClass == "error") {
        return EvalError{result.payload.getString("msg", "Cannot evaluate " + expression)};
    }
    if (result.recordClass != "done") {
        REPLAY_BRIDGE_FATAL("data-evaluate-expression", "Not completed the gdb/mi command: " + commandWas);
    }

    const MiValue* value = result.payload.find("value");
    if (!value || !value->isString()) {
        REPLAY_BRIDGE_FATAL("data-evaluate-expression", "No value in the reply to: " + commandWas);
    }

    switch (kind) {
        case EvalKind::STRING:
            return parseGdbStringResponse(value->text);
        case EvalKind::INT: {
            int parsed = 0;
            if (!parseInt(value->text, parsed)) {
                return EvalError{"Not an integer: " + value->text};
            }
            return EvalInt{parsed};
        }
        case EvalKind::VALUE:
            break;
    }
    return EvalString{value->text};
}

std::string NativeDebugger::evaluateRaw(const std::string& expression, Verbosity verbosity) {
    MiRecord result = sendExpectingDone("data-evaluate-expression", {expression}, verbosity);
    const MiValue* value = result.payload.find("value");
    if (!value || !value->isString()) {
        REPLAY_BRIDGE_FATAL("data-evaluate-expression",
                            "No value in the reply to: data-evaluate-expression " + expression);
    }
    return value->text;
}

std::string NativeDebugger::evaluateString(const std::string& expression, Verbosity verbosity) {
    EvalResult parsed = parseGdbStringResponse(evaluateRaw(expression, verbosity));
    if (auto* error = std::get_if<EvalError>(&parsed)) {
        REPLAY_BRIDGE_FATAL("evaluateString", error->message);
    }
    return std::get<EvalString>(parsed).value;
}

int NativeDebugger::evaluateInt(const std::string& expression, Verbosity verbosity) {
    std::string text = evaluateRaw(expression, verbosity);
    int value = 0;
    if (!parseInt(text, value)) {
        REPLAY_BRIDGE_FATAL("evaluateInt", "Expected an integer from '" + expression + "', got: " + text);
    }
    return value;
}

bool NativeDebugger::resume(const std::string& execCommand, bool reverse, std::string& error,
                            Verbosity verbosity) {
    std::vector<std::string> args;
    if (reverse) {
        args.push_back("--reverse");
    }
    MiRecord result = send(execCommand, args, verbosity);
    if (result.recordClass == "running") {
        return true;
    }
    if (result.recordClass == "error") {
        error = result.payload.getString("msg", "Execution did not resume");
        return false;
    }
    REPLAY_BRIDGE_FATAL(execCommand, "Execution did not resume: " +
                        (result.recordClass.empty() ? result.raw : result.recordClass));
}

void NativeDebugger::connectToReplay(const std::string& address) {
    MiRecord result = send("target-select", {"extended-remote", address}, Verbosity::NOISY);
    if (result.recordClass != "connected" && result.recordClass != "done") {
        REPLAY_BRIDGE_FATAL("target-select", "Could not connect to the replay at " + address + ": " +
                            result.payload.getString("msg", result.recordClass));
    }
}

bool NativeDebugger::insertBreakpoint(const std::string& location, bool temporary, bool disabled,
                                      const std::string& condition, NativeBreakpoint& out,
                                      std::string& error, Verbosity verbosity) {
    std::vector<std::string> args;
    if (temporary) args.push_back("-t");
    if (disabled) args.push_back("-d");
    if (!condition.empty()) {
        args.push_back("-c");
        args.push_back(condition);
    }
    args.push_back(location);

    MiRecord result = send("break-insert", args, verbosity);
    if (result.recordClass == "error") {
        error = result.payload.getString("msg", "Could not set breakpoint at " + location);
        return false;
    }
    if (result.recordClass != "done") {
        REPLAY_BRIDGE_FATAL("break-insert", "Not completed the gdb/mi command: break-insert " + joinArgs(args));
    }

    const MiValue* bkpt = result.payload.find("bkpt");
    if (!bkpt || bkpt->getString("number").empty()) {
        REPLAY_BRIDGE_FATAL("break-insert", "No breakpoint number in the reply for " + location);
    }

    out.number = bkpt->getString("number");
    out.file = bkpt->getString("fullname", bkpt->getString("file"));
    parseInt(bkpt->getString("line"), out.line);
    out.temporary = bkpt->getString("disp") == "del";
    out.enabled = bkpt->getString("enabled", "y") == "y";
    return true;
}

bool NativeDebugger::deleteBreakpoint(const std::string& number, std::string& error, Verbosity verbosity) {
    MiRecord result = send("break-delete", {number}, verbosity);
    if (result.recordClass == "done") return true;
    error = result.payload.getString("msg", "Could not delete breakpoint " + number);
    return false;
}

bool NativeDebugger::enableBreakpoint(const std::string& number, bool enable, std::string& error,
                                      Verbosity verbosity) {
    MiRecord result = send(enable ? "break-enable" : "break-disable", {number}, verbosity);
    if (result.recordClass == "done") return true;
    error = result.payload.getString("msg", "Could not update breakpoint " + number);
    return false;
}

int NativeDebugger::stackDepth(Verbosity verbosity) {
    MiRecord result = sendExpectingDone("stack-info-depth", {}, verbosity);
    int depth = 0;
    if (!parseInt(result.payload.getString("depth"), depth)) {
        REPLAY_BRIDGE_FATAL("stack-info-depth", "No depth in the reply");
    }
    return depth;
}

std::vector<NativeFrame> NativeDebugger::listFrames(Verbosity verbosity) {
    MiRecord result = sendExpectingDone("stack-list-frames", {}, verbosity);
    std::vector<NativeFrame> frames;

    const MiValue* stack = result.payload.find("stack");
    if (!stack) return frames;

    for (const MiValue* frame : stack->elements()) {
        NativeFrame f;
        parseInt(frame->getString("level"), f.level);
        f.function = frame->getString("func");
        f.file = frame->getString("file");
        f.fullname = frame->getString("fullname", f.file);
        parseInt(frame->getString("line"), f.line);
        f.address = frame->getString("addr");
        frames.push_back(f);
    }
    return frames;
}

bool NativeDebugger::selectFrame(int level, Verbosity verbosity) {
    MiRecord result = send("stack-select-frame", {std::to_string(level)}, verbosity);
    return result.recordClass == "done";
}

std::vector<NativeVariable> NativeDebugger::listVariables(Verbosity verbosity) {
    MiRecord result = sendExpectingDone("stack-list-variables", {"--simple-values"}, verbosity);
    std::vector<NativeVariable> variables;

    const MiValue* list = result.payload.find("variables");
    if (!list) return variables;

    for (const MiValue* variable : list->elements()) {
        variables.push_back(NativeVariable{
            variable->getString("name"),
            variable->getString("type"),
            variable->getString("value")});
    }
    return variables;
}

EvalResult parseGdbStringResponse(const std::string& gdbResponse) {
    auto first = gdbResponse.find('"');
    auto last = gdbResponse.rfind('"');

    if (first == std::string::npos || first == last) {
        return EvalError{"Improper gdb data-evaluate-expression string response to: " + gdbResponse};
    }
    return EvalString{unquoteGdbStringResult(gdbResponse.substr(first + 1, last - first - 1))};
}

std::string unquoteGdbStringResult(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        if (input[i] == '\\' && i + 1 < input.size() && input[i + 1] == '"') {
            out.push_back('"');
            ++i;
        } else {
            out.push_back(input[i]);
        }
    }
    return out;
}
