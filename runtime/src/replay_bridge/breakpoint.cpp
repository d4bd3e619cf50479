#include "replay_bridge/breakpoint.hpp"
#include "logger.hpp"

bool BreakpointRegistry::addBreakpoint(Breakpoint bp) {
    bp.id = bp.nativeRef;
    if (bp.id.empty()) {
        return false;
    }

    std::string id = bp.id;
    auto [it, inserted] = breakpoints.emplace(id, std::move(bp));
    if (!inserted) {
        LOG_WARNING("Breakpoint ", id, " is already registered");
        return false;
    }

    LOG_DEBUG("Breakpoint ", id, " set at ", it->second.filename, ":", it->second.lineno,
              it->second.temporary ? " (temporary)" : "");
    return true;
}

bool BreakpointRegistry::removeBreakpoint(const std::string& id) {
    auto it = breakpoints.find(id);
    if (it != breakpoints.end()) {
        breakpoints.erase(it);
        LOG_DEBUG("Breakpoint ", id, " removed");
        return true;
    }
    return false;
}

bool BreakpointRegistry::setEnabled(const std::string& id, bool enable) {
    auto it = breakpoints.find(id);
    if (it == breakpoints.end()) {
        return false;
    }
    it->second.enabled = enable;
    LOG_DEBUG("Breakpoint ", id, enable ? " enabled" : " disabled");
    return true;
}

void BreakpointRegistry::recordHit(const std::string& id) {
    auto it = breakpoints.find(id);
    if (it != breakpoints.end()) {
        it->second.hitCount++;
    }
}

bool BreakpointRegistry::isEnabledTemporaryBreakpoint(const std::string& id) const {
    auto it = breakpoints.find(id);
    return it != breakpoints.end() && it->second.enabled && it->second.temporary;
}

bool BreakpointRegistry::isEnabledBreakpoint(const std::string& id) const {
    auto it = breakpoints.find(id);
    return it != breakpoints.end() && it->second.enabled && !it->second.temporary;
}

bool BreakpointRegistry::hasBreakpoint(const std::string& id) const {
    return breakpoints.find(id) != breakpoints.end();
}

const BreakpointRegistry::Breakpoint* BreakpointRegistry::getBreakpoint(const std::string& id) const {
    auto it = breakpoints.find(id);
    return it != breakpoints.end() ? &it->second : nullptr;
}

BreakpointRegistry::Breakpoint* BreakpointRegistry::getBreakpoint(const std::string& id) {
    auto it = breakpoints.find(id);
    return it != breakpoints.end() ? &it->second : nullptr;
}

std::vector<BreakpointRegistry::Breakpoint> BreakpointRegistry::getAllBreakpoints() const {
    std::vector<Breakpoint> result;
    result.reserve(breakpoints.size());
    for (const auto& [_, bp] : breakpoints) {
        result.push_back(bp);
    }
    return result;
}

const char* BreakpointRegistry::typeName(Type type) {
    switch (type) {
        case Type::LINE:        return "line";
        case Type::CONDITIONAL: return "conditional";
    }
    return "line";
}
