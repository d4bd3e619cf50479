#include "replay_bridge/console_processor.hpp"
#include "replay_bridge/ide_connection.hpp"
#include "replay_bridge/session_state.hpp"
#include "logger.hpp"
#include <sstream>

namespace {
const int INPUT_POLL_MS = 200;
}

ConsoleProcessor::ConsoleProcessor(SessionState& session, IdeChannel& ide,
                                   const UIHelper::PromptOptions& options)
    : session(session), ide(ide), ui(std::make_unique<UIHelper>(options)) {
    registerCommands();
    ui->setCompletionCallback([this](const std::string& partial) {
        return getCompletions(partial);
    });
}

ConsoleProcessor::~ConsoleProcessor() = default;

void ConsoleProcessor::run() {
    ui->printInfo("Type 'help' for the list of console commands.");
    reportDirection();

    std::string input;
    while (!stopRequested) {
        auto status = ui->readInput(input, INPUT_POLL_MS);
        if (status == UIHelper::InputStatus::CLOSED) {
            LOG_DEBUG("Console input closed");
            break;
        }
        if (status == UIHelper::InputStatus::LINE && !processCommand(input)) {
            break;
        }
    }
}

void ConsoleProcessor::registerCommands() {
    registerCommand(Command("help", "h", "Show console commands",
                            [this](const auto& args) { return cmdHelp(args); }));
    registerCommand(Command("toggle", "t", "Flip between forward and reverse execution",
                            [this](const auto& args) { return cmdToggle(args); }));
    registerCommand(Command("reverse", "r", "Run and step backwards in time",
                            [this](const auto& args) { return cmdReverse(args); }));
    registerCommand(Command("forward", "f", "Run and step forwards in time",
                            [this](const auto& args) { return cmdForward(args); }));
    registerCommand(Command("status", "s", "Show the session status",
                            [this](const auto& args) { return cmdStatus(args); }));
    registerCommand(Command("quit", "q", "End the debugging session",
                            [this](const auto& args) { return cmdQuit(args); }));
}

void ConsoleProcessor::registerCommand(const Command& cmd) {
    commands[cmd.name] = cmd;
    if (!cmd.shortcut.empty()) {
        commands[cmd.shortcut] = cmd;
    }
}

bool ConsoleProcessor::hasCommand(const std::string& name) const {
    return commands.find(name) != commands.end();
}

bool ConsoleProcessor::processCommand(const std::string& cmdLine) {
    auto args = parseCommandLine(cmdLine);
    if (args.empty()) return true;

    auto cmdIt = commands.find(args[0]);
    if (cmdIt == commands.end()) {
        ui->printError("Unknown command: " + args[0] + " (try 'help')");
        return true;
    }
    return cmdIt->second.handler(args);
}

std::vector<std::string> ConsoleProcessor::parseCommandLine(const std::string& cmdLine) const {
    std::vector<std::string> args;
    std::istringstream iss(cmdLine);
    std::string word;
    while (iss >> word) {
        args.push_back(word);
    }
    return args;
}

std::vector<std::string> ConsoleProcessor::getCompletions(const std::string& partial) const {
    std::vector<std::string> matches;
    for (const auto& [name, cmd] : commands) {
        if (name == cmd.name && name.compare(0, partial.size(), partial) == 0) {
            matches.push_back(name);
        }
    }
    return matches;
}

void ConsoleProcessor::showHelp() const {
    ui->printInfo("Console commands:");
    for (const auto& [name, cmd] : commands) {
        if (name == cmd.name) {  // Only primary commands, not shortcuts
            ui->printInfo("  " + cmd.name + " (" + cmd.shortcut + ")  " + cmd.description);
        }
    }
}

void ConsoleProcessor::reportDirection() const {
    ui->printInfo(session.reverseMode ? "Execution direction: REVERSE" : "Execution direction: forward");
}

bool ConsoleProcessor::cmdHelp(const std::vector<std::string>&) {
    showHelp();
    return true;
}

bool ConsoleProcessor::cmdToggle(const std::vector<std::string>&) {
    // Only this thread writes the flag
    session.reverseMode = !session.reverseMode.load();
    reportDirection();
    return true;
}

bool ConsoleProcessor::cmdReverse(const std::vector<std::string>&) {
    session.reverseMode = true;
    reportDirection();
    return true;
}

bool ConsoleProcessor::cmdForward(const std::vector<std::string>&) {
    session.reverseMode = false;
    reportDirection();
    return true;
}

bool ConsoleProcessor::cmdStatus(const std::vector<std::string>&) {
    std::ostringstream ss;
    ss << "status: " << toString(session.status.load())
       << ", direction: " << (session.reverseMode ? "reverse" : "forward")
       << ", last transaction: " << session.lastSequenceNum.load();
    ui->printInfo(ss.str());
    return true;
}

bool ConsoleProcessor::cmdQuit(const std::vector<std::string>&) {
    ui->printInfo("Closing the IDE connection");
    ide.close();
    return false;
}
