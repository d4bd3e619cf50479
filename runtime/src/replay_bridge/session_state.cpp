#include "replay_bridge/session_state.hpp"

const char* toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::STARTING: return "starting";
        case SessionStatus::STOPPING: return "stopping";
        case SessionStatus::STOPPED:  return "stopped";
        case SessionStatus::RUNNING:  return "running";
        case SessionStatus::BREAK:    return "break";
    }
    return "starting";
}

const char* toString(SessionReason reason) {
    switch (reason) {
        case SessionReason::OK:        return "ok";
        case SessionReason::ERROR:     return "error";
        case SessionReason::ABORTED:   return "aborted";
        case SessionReason::EXCEPTION: return "exception";
    }
    return "ok";
}

std::map<std::string, FeatureValue> defaultFeatureMap(const std::string& language) {
    return {
        {"language_supports_threads", {"0", true}},
        {"language_name",             {language, true}},
        {"language_version",          {"7.0", true}},
        {"encoding",                  {"iso-8859-1", true}},
        {"protocol_version",          {"1", true}},
        {"supports_async",            {"0", true}},
        {"breakpoint_types",          {"line conditional", true}},
        {"multiple_sessions",         {"0", false}},
        {"max_children",              {"64", false}},
        {"max_data",                  {"2048", false}},
        {"max_depth",                 {"1", false}},
        {"extended_properties",       {"0", false}},
        {"show_hidden",               {"0", false}},
        {"notify_ok",                 {"0", false}},
    };
}

int SessionState::sourceId(const std::string& path) {
    auto it = sourceMap.find(path);
    if (it != sourceMap.end()) {
        return it->second;
    }
    int id = static_cast<int>(sourceMap.size()) + 1;
    sourceMap[path] = id;
    return id;
}
