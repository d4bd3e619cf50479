#ifndef REPLAY_BRIDGE_MI_RECORD_HPP
#define REPLAY_BRIDGE_MI_RECORD_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

// One value of gdb/MI output: a c-string, a {tuple} or a [list].
// Lists hold either plain values (items) or named results (fields).
struct MiValue {
    enum class Kind {
        STRING,
        TUPLE,
        LIST
    };

    Kind kind{Kind::STRING};
    std::string text;
    std::vector<std::pair<std::string, MiValue>> fields;
    std::vector<MiValue> items;

    static MiValue makeString(const std::string& s);
    static MiValue makeTuple();
    static MiValue makeList();

    bool isString() const { return kind == Kind::STRING; }
    bool isTuple() const { return kind == Kind::TUPLE; }
    bool isList() const { return kind == Kind::LIST; }

    // First field with this name, nullptr if absent
    const MiValue* find(const std::string& name) const;
    std::string getString(const std::string& name, const std::string& fallback = "") const;
    // Values of a list regardless of whether its elements are named
    std::vector<const MiValue*> elements() const;

    MiValue& add(const std::string& name, MiValue value);
    MiValue& add(const std::string& name, const std::string& value);

    std::string toString() const;
};

struct MiRecord {
    enum class Kind {
        RESULT,         // ^done, ^running, ^error, ...
        EXEC_ASYNC,     // *stopped, *running
        STATUS_ASYNC,   // +download
        NOTIFY_ASYNC,   // =breakpoint-modified, =thread-created
        CONSOLE_STREAM, // ~"text"
        TARGET_STREAM,  // @"text"
        LOG_STREAM,     // &"text"
        PROMPT,         // (gdb)
        UNKNOWN         // anything that is not MI output
    };

    Kind kind{Kind::UNKNOWN};
    std::optional<long> token;
    std::string recordClass;
    MiValue payload{MiValue::makeTuple()};
    std::string text;   // stream content
    std::string raw;    // the line as received

    std::string toString() const;
};

MiRecord parseMiLine(const std::string& line);

// Quotes a command argument as an MI c-string when it needs it
std::string quoteMiArgument(const std::string& argument);

#endif // REPLAY_BRIDGE_MI_RECORD_HPP
