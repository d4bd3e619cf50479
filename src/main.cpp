#include <iostream>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <memory>
#include <thread>
#include <unistd.h>

#include "logger.hpp"
#include "replay_bridge/command_dispatcher.hpp"
#include "replay_bridge/config.hpp"
#include "replay_bridge/console_processor.hpp"
#include "replay_bridge/dbgp_codec.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "replay_bridge/gdb_mi_process.hpp"
#include "replay_bridge/ide_connection.hpp"
#include "replay_bridge/native_debugger.hpp"
#include "replay_bridge/preflight.hpp"
#include "replay_bridge/replay_process.hpp"
#include "replay_bridge/session_state.hpp"

namespace {

const char* const APP_ID = "replay-bridge";

// Runs the console on its own thread for as long as the session lives
class ConsoleThread {
public:
    ConsoleThread(SessionState& session, IdeChannel& ide, const BridgeConfig::ConsoleConfig& config)
        : console(session, ide, UIHelper::PromptOptions(config.prompt, config.enableHistory,
                                                         true, config.maxHistorySize)) {
        thread = std::thread([this] { console.run(); });
    }

    ~ConsoleThread() {
        console.requestStop();
        if (thread.joinable()) {
            thread.join();
        }
    }

private:
    ConsoleProcessor console;
    std::thread thread;
};

int parsePort(const char* text, const char* flag) {
    char* end = nullptr;
    long port = std::strtol(text, &end, 10);
    if (*end != '\0' || port <= 0 || port > 65535) {
        std::cerr << "Error: Invalid port for " << flag << ": " << text << std::endl;
        std::exit(1);
    }
    return static_cast<int>(port);
}

void runBridge(const BridgeConfig& config) {
    const auto& replayConfig = config.replay();

    std::string gdbPath = checkGdbExecutable(replayConfig.gdbExecutable);
    std::string rrPath = checkRrExecutable(replayConfig.rrExecutable);
    if (!config.preflight().runtimeExecutable.empty()) {
        checkRuntimeExecutable(config.preflight().runtimeExecutable);
    }

    // The init packet needs an absolute file URI
    std::string traceDir;
    if (!replayConfig.traceDir.empty()) {
        traceDir = resolveExistingPath(replayConfig.traceDir, "trace directory");
    }
    std::string entryFile;
    if (!replayConfig.entryFile.empty()) {
        entryFile = resolveExistingPath(replayConfig.entryFile, "entry file");
    }

    SessionState session;
    session.featureMap = defaultFeatureMap(config.session().language);
    session.entryFile = entryFile;
    session.reverseMode = config.session().startReverse;

    ReplayProcess replay;
    replay.start(rrPath, replayConfig.replayPort, traceDir);
    session.replay = &replay;

    GdbMiProcess gdb;
    bool showNotifications = config.trace().showNotifications;
    gdb.setNotificationHandler([&session, showNotifications](const MiRecord& record) {
        if (showNotifications) {
            LOG_INFO("gdb notification: ", record.raw);
        } else {
            LOG_DEBUG("gdb notification: ", record.raw);
        }
        if (auto stop = stopEventFromRecord(record)) {
            session.notifier.post(*stop);
        }
    });
    gdb.setCloseHandler([&session] { session.notifier.close(); });
    try {
        gdb.start(gdbPath);
    } catch (const MiTransportError& e) {
        REPLAY_BRIDGE_FATAL("gdb", e.what());
    }

    NativeDebugger debugger(gdb);
    session.debugger = &debugger;
    debugger.connectToReplay(replay.getAddress());

    SocketIdeChannel ide;
    std::string error;
    if (!ide.connectTo(config.ide().host, config.ide().port, error)) {
        REPLAY_BRIDGE_FATAL("ide", error);
    }
    session.ide = &ide;

    std::string init = initPacket(APP_ID, config.ide().ideKey, config.session().language,
                                  pathToFileUri(session.entryFile));
    if (!ide.writePacket(constructPacket(init))) {
        REPLAY_BRIDGE_FATAL("ide", "Could not send the init packet");
    }

    std::unique_ptr<ConsoleThread> console;
    if (config.console().enabled && isatty(STDIN_FILENO)) {
        console = std::make_unique<ConsoleThread>(session, ide, config.console());
    }

    CommandDispatcher dispatcher(session, ide, debugger, config.session().noisyCommands);
    dispatcher.run();
}

}

int main(int argc, char** argv) {
    auto config = BridgeConfig::getInstance();
    std::string logLevel;
    bool noColor = false;
    bool traceDirGiven = false;
    std::string writeConfigPath;

    auto printHelp = [&]() {
        std::cout << "ReplayBridge - debug rr recordings from a DBGp IDE, forwards and backwards\n" << std::endl;
        std::cout << "Usage: " << argv[0] << " [trace-dir] [OPTIONS]\n" << std::endl;

        std::cout << "Basic Options:" << std::endl;
        std::cout << "  -h, --help                Show this help message" << std::endl;
        std::cout << "  --config FILE             Read settings from an INI file" << std::endl;
        std::cout << "  --write-config FILE       Write the effective settings to FILE and exit" << std::endl;
        std::cout << "  --ide-host HOST           IDE to connect to (default: 127.0.0.1)" << std::endl;
        std::cout << "  --ide-port N              IDE DBGp port (default: 9000)" << std::endl;
        std::cout << "  --entry-file FILE         Script announced to the IDE" << std::endl;
        std::cout << "  --reverse                 Start in reverse mode" << std::endl;
        std::cout << "  --no-console              Do not read console commands from the terminal" << std::endl;
        std::cout << std::endl;

        std::cout << "Replay Options:" << std::endl;
        std::cout << "  --replay-port N           Port for rr's gdbserver (default: 9999)" << std::endl;
        std::cout << "  --rr-executable PATH      rr to use (default: rr on PATH)" << std::endl;
        std::cout << "  --gdb-executable PATH     gdb to use (default: gdb on PATH)" << std::endl;
        std::cout << std::endl;

        std::cout << "Logging Options:" << std::endl;
        std::cout << "  --log-level LEVEL         Set logging level (ERROR, WARNING, INFO, DEBUG, TRACE)" << std::endl;
        std::cout << "  -q, --quiet               Quiet mode (--log-level ERROR)" << std::endl;
        std::cout << "  -v, --verbose             Verbose mode (--log-level DEBUG)" << std::endl;
        std::cout << "  --show-notifications      Show gdb's async notifications" << std::endl;
        std::cout << "  --no-color                Disable colored output" << std::endl;
        std::cout << std::endl;
    };

    // Help and the config file come first so the other flags override it
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printHelp();
            return 0;
        }
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            if (!config->loadFromFile(argv[i + 1])) {
                return 1;
            }
        }
    }

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        }
        else if (strcmp(argv[i], "--write-config") == 0 && i + 1 < argc) {
            writeConfigPath = argv[++i];
        }
        else if (strcmp(argv[i], "--ide-host") == 0 && i + 1 < argc) {
            config->ide().host = argv[++i];
        }
        else if (strcmp(argv[i], "--ide-port") == 0 && i + 1 < argc) {
            config->ide().port = parsePort(argv[++i], "--ide-port");
        }
        else if (strcmp(argv[i], "--replay-port") == 0 && i + 1 < argc) {
            config->replay().replayPort = parsePort(argv[++i], "--replay-port");
        }
        else if (strcmp(argv[i], "--gdb-executable") == 0 && i + 1 < argc) {
            config->replay().gdbExecutable = argv[++i];
        }
        else if (strcmp(argv[i], "--rr-executable") == 0 && i + 1 < argc) {
            config->replay().rrExecutable = argv[++i];
        }
        else if (strcmp(argv[i], "--entry-file") == 0 && i + 1 < argc) {
            config->replay().entryFile = argv[++i];
        }
        else if (strcmp(argv[i], "--reverse") == 0) {
            config->session().startReverse = true;
        }
        else if (strcmp(argv[i], "--show-notifications") == 0) {
            config->trace().showNotifications = true;
        }
        else if (strcmp(argv[i], "--no-console") == 0) {
            config->console().enabled = false;
        }
        else if (strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            logLevel = argv[++i];
        }
        else if (strcmp(argv[i], "-q") == 0 || strcmp(argv[i], "--quiet") == 0) {
            logLevel = "ERROR";
        }
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            logLevel = "DEBUG";
        }
        else if (strcmp(argv[i], "--no-color") == 0) {
            noColor = true;
        }
        else if (argv[i][0] != '-' && !traceDirGiven) {
            config->replay().traceDir = argv[i];
            traceDirGiven = true;
        }
        else {
            std::cerr << "Error: Unknown option " << argv[i] << std::endl;
            printHelp();
            return 1;
        }
    }

    if (!logLevel.empty()) {
        config->trace().logLevel = logLevel;
    }
    if (noColor) {
        config->trace().color = false;
    }
    if (!writeConfigPath.empty()) {
        return config->saveToFile(writeConfigPath) ? 0 : 1;
    }

    std::string level = config->trace().logLevel;
    if (!Logger::setLevelFromString(level)) {
        LOG_WARNING("Unknown log level '", level, "', using INFO");
    }
    Logger::setColorEnabled(config->trace().color);

    // A dead gdb shows up as a failed write, not a signal
    signal(SIGPIPE, SIG_IGN);

    try {
        runBridge(*config);
    } catch (const FatalError& e) {
        LOG_ERROR(e.describe());
        return 1;
    }
    return 0;
}
