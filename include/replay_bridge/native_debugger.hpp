#ifndef REPLAY_BRIDGE_NATIVE_DEBUGGER_HPP
#define REPLAY_BRIDGE_NATIVE_DEBUGGER_HPP

#include "mi_channel.hpp"
#include <string>
#include <variant>
#include <vector>

// How loudly a single native debugger call is traced. Passed per call so no
// shared switch is flipped around it.
enum class Verbosity {
    AMBIENT,    // follows the logger level (debug)
    NOISY       // always shown
};

// Result of evaluating an expression in the native debugger
struct EvalString {
    std::string value;
};

struct EvalInt {
    int value;
};

struct EvalError {
    std::string message;
};

using EvalResult = std::variant<EvalString, EvalInt, EvalError>;

enum class EvalKind {
    STRING,     // a char* rendered as 0xADDR "contents", unquoted
    INT,        // a decimal integer
    VALUE       // the value text exactly as gdb prints it
};

struct NativeBreakpoint {
    std::string number;
    std::string file;
    int line{0};
    bool temporary{false};
    bool enabled{true};
};

struct NativeFrame {
    int level{0};
    std::string function;
    std::string file;
    std::string fullname;
    int line{0};
    std::string address;
};

struct NativeVariable {
    std::string name;
    std::string type;
    std::string value;
};

// Typed wrapper over the native debugger's machine interface
class NativeDebugger {
public:
    explicit NativeDebugger(MiChannel& channel) : channel(channel) {}

    // Transport failures are fatal
    MiRecord send(const std::string& command,
                  const std::vector<std::string>& args = {},
                  Verbosity verbosity = Verbosity::AMBIENT);

    EvalResult evaluate(const std::string& expression, EvalKind kind,
                        Verbosity verbosity = Verbosity::AMBIENT);
    std::string evaluateRaw(const std::string& expression, Verbosity verbosity = Verbosity::AMBIENT);
    std::string evaluateString(const std::string& expression, Verbosity verbosity = Verbosity::AMBIENT);
    int evaluateInt(const std::string& expression, Verbosity verbosity = Verbosity::AMBIENT);

    // exec-continue / exec-step / exec-next / exec-finish, optionally --reverse.
    // A refusal (^error, e.g. finish in the outermost frame) returns false with
    // gdb's message in error; no stop follows it. A reply without a class is fatal.
    bool resume(const std::string& execCommand, bool reverse, std::string& error,
                Verbosity verbosity = Verbosity::AMBIENT);

    void connectToReplay(const std::string& address);

    // Recoverable failures (bad location, unknown number) return false with
    // gdb's message in error.
    bool insertBreakpoint(const std::string& location, bool temporary, bool disabled,
                          const std::string& condition, NativeBreakpoint& out,
                          std::string& error, Verbosity verbosity = Verbosity::AMBIENT);
    bool deleteBreakpoint(const std::string& number, std::string& error,
                          Verbosity verbosity = Verbosity::AMBIENT);
    bool enableBreakpoint(const std::string& number, bool enable, std::string& error,
                          Verbosity verbosity = Verbosity::AMBIENT);

    int stackDepth(Verbosity verbosity = Verbosity::AMBIENT);
    std::vector<NativeFrame> listFrames(Verbosity verbosity = Verbosity::AMBIENT);
    bool selectFrame(int level, Verbosity verbosity = Verbosity::AMBIENT);
    std::vector<NativeVariable> listVariables(Verbosity verbosity = Verbosity::AMBIENT);

private:
    MiChannel& channel;

    MiRecord sendExpectingDone(const std::string& command, const std::vector<std::string>& args,
                               Verbosity verbosity);
};

// A gdb string looks like '0x7f261d8624e8 "some string here"', an empty one
// like '0x7f44a33a9c1e ""'. Yields EvalString or EvalError.
EvalResult parseGdbStringResponse(const std::string& gdbResponse);
std::string unquoteGdbStringResult(const std::string& input);

#endif // REPLAY_BRIDGE_NATIVE_DEBUGGER_HPP
