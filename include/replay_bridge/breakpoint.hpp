#ifndef REPLAY_BRIDGE_BREAKPOINT_HPP
#define REPLAY_BRIDGE_BREAKPOINT_HPP

#include <map>
#include <string>
#include <vector>

// Protocol-visible breakpoints keyed by id. The id is the native debugger's
// breakpoint number, so a stop event can be matched without translation.
class BreakpointRegistry {
public:
    enum class Type {
        LINE,
        CONDITIONAL
    };

    struct Breakpoint {
        std::string id;
        Type type{Type::LINE};
        bool enabled{true};
        bool temporary{false};
        std::string nativeRef;
        std::string filename;   // file:// uri as the IDE sent it
        int lineno{0};
        std::string expression;
        int hitValue{0};
        std::string hitCondition;
        size_t hitCount{0};
    };

    BreakpointRegistry() = default;

    // Registers under bp.nativeRef; returns false if that id is already taken
    bool addBreakpoint(Breakpoint bp);
    bool removeBreakpoint(const std::string& id);
    bool setEnabled(const std::string& id, bool enable);
    void recordHit(const std::string& id);

    bool isEnabledTemporaryBreakpoint(const std::string& id) const;
    bool isEnabledBreakpoint(const std::string& id) const;
    bool hasBreakpoint(const std::string& id) const;

    const Breakpoint* getBreakpoint(const std::string& id) const;
    Breakpoint* getBreakpoint(const std::string& id);
    std::vector<Breakpoint> getAllBreakpoints() const;
    size_t size() const { return breakpoints.size(); }

    static const char* typeName(Type type);

private:
    std::map<std::string, Breakpoint> breakpoints;
};

#endif // REPLAY_BRIDGE_BREAKPOINT_HPP
