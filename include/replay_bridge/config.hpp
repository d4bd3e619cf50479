#ifndef REPLAY_BRIDGE_CONFIG_HPP
#define REPLAY_BRIDGE_CONFIG_HPP

#include <memory>
#include <set>
#include <string>

class BridgeConfig {
public:
    // Configuration groups
    struct IdeConfig {
        std::string host{"127.0.0.1"};
        int port{9000};
        std::string ideKey;
    };

    struct ReplayConfig {
        std::string traceDir;       // empty replays the latest recording
        std::string rrExecutable{"rr"};
        std::string gdbExecutable{"gdb"};
        int replayPort{9999};
        std::string entryFile;
    };

    struct SessionConfig {
        std::string language{"PHP"};
        bool startReverse{false};
        std::set<std::string> noisyCommands;
    };

    struct TraceConfig {
        std::string logLevel{"INFO"};
        bool color{true};
        bool showNotifications{false};
    };

    struct ConsoleConfig {
        bool enabled{true};
        std::string prompt{"(replay-bridge) "};
        bool enableHistory{true};
        size_t maxHistorySize{1000};
    };

    struct PreflightConfig {
        std::string runtimeExecutable;  // empty skips the runtime check
    };

    // Singleton access
    static std::shared_ptr<BridgeConfig> getInstance() {
        static std::shared_ptr<BridgeConfig> instance = std::shared_ptr<BridgeConfig>(new BridgeConfig);
        return instance;
    }

    IdeConfig& ide() { return ideConfig; }
    ReplayConfig& replay() { return replayConfig; }
    SessionConfig& session() { return sessionConfig; }
    TraceConfig& trace() { return traceConfig; }
    ConsoleConfig& console() { return consoleConfig; }
    PreflightConfig& preflight() { return preflightConfig; }

    const IdeConfig& ide() const { return ideConfig; }
    const ReplayConfig& replay() const { return replayConfig; }
    const SessionConfig& session() const { return sessionConfig; }
    const TraceConfig& trace() const { return traceConfig; }
    const ConsoleConfig& console() const { return consoleConfig; }
    const PreflightConfig& preflight() const { return preflightConfig; }

    // A loaded file starts from the defaults; --write-config saves one
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

    bool isNoisyCommand(const std::string& command) const {
        return sessionConfig.noisyCommands.count(command) > 0;
    }

private:
    BridgeConfig() = default;

    IdeConfig ideConfig;
    ReplayConfig replayConfig;
    SessionConfig sessionConfig;
    TraceConfig traceConfig;
    ConsoleConfig consoleConfig;
    PreflightConfig preflightConfig;

    // Make config non-copyable
    BridgeConfig(const BridgeConfig&) = delete;
    BridgeConfig& operator=(const BridgeConfig&) = delete;
};

#endif // REPLAY_BRIDGE_CONFIG_HPP
