#ifndef REPLAY_BRIDGE_SESSION_STATE_HPP
#define REPLAY_BRIDGE_SESSION_STATE_HPP

#include "breakpoint.hpp"
#include "stop_notifier.hpp"
#include <atomic>
#include <map>
#include <string>
#include <vector>

class IdeChannel;
class NativeDebugger;
class ReplayProcess;

enum class SessionStatus {
    STARTING,
    STOPPING,
    STOPPED,
    RUNNING,
    BREAK
};

enum class SessionReason {
    OK,
    ERROR,
    ABORTED,
    EXCEPTION
};

const char* toString(SessionStatus status);
const char* toString(SessionReason reason);

struct FeatureValue {
    std::string value;
    bool readOnly{false};
};

// Features advertised to the IDE through feature_get / feature_set
std::map<std::string, FeatureValue> defaultFeatureMap(const std::string& language);

// Everything the bridge knows about one IDE connection
struct SessionState {
    std::atomic<SessionStatus> status{SessionStatus::STARTING};
    SessionReason reason{SessionReason::OK};
    std::atomic<int> lastSequenceNum{0};     // read by the console thread

    std::map<std::string, FeatureValue> featureMap;
    BreakpointRegistry breakpoints;
    std::map<std::string, int> sourceMap;   // logical path -> file id
    int maxStackDepth{0};
    std::vector<int> levelAr;               // stack levels of the last stack_get

    std::string entryFile;
    std::atomic<bool> reverseMode{false};   // toggled from the console thread
    StopNotifier notifier;

    IdeChannel* ide{nullptr};
    NativeDebugger* debugger{nullptr};
    ReplayProcess* replay{nullptr};

    SessionState() = default;
    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    // Returns the id for path, registering it if new
    int sourceId(const std::string& path);
};

#endif // REPLAY_BRIDGE_SESSION_STATE_HPP
