#ifndef REPLAY_BRIDGE_CONSOLE_PROCESSOR_HPP
#define REPLAY_BRIDGE_CONSOLE_PROCESSOR_HPP

#include "ui_helper.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct SessionState;
class IdeChannel;

// Terminal commands for the person running the bridge, mainly switching the
// direction the IDE's run and step commands travel in
class ConsoleProcessor {
public:
    struct Command {
        std::string name;
        std::string shortcut;
        std::string description;
        std::function<bool(const std::vector<std::string>&)> handler;

        Command(const std::string& n = "",
                const std::string& s = "",
                const std::string& d = "",
                std::function<bool(const std::vector<std::string>&)> h = nullptr)
            : name(n), shortcut(s), description(d), handler(h) {}
    };

    ConsoleProcessor(SessionState& session, IdeChannel& ide,
                     const UIHelper::PromptOptions& options = UIHelper::PromptOptions());
    ~ConsoleProcessor();

    // Reads commands until quit, end of input or requestStop()
    void run();
    void requestStop() { stopRequested = true; }

    // False once the console should finish
    bool processCommand(const std::string& cmdLine);
    bool hasCommand(const std::string& name) const;
    std::vector<std::string> getCompletions(const std::string& partial) const;

private:
    SessionState& session;
    IdeChannel& ide;
    std::unique_ptr<UIHelper> ui;
    std::map<std::string, Command> commands;
    std::atomic<bool> stopRequested{false};

    void registerCommands();
    void registerCommand(const Command& cmd);

    bool cmdHelp(const std::vector<std::string>& args);
    bool cmdToggle(const std::vector<std::string>& args);
    bool cmdReverse(const std::vector<std::string>& args);
    bool cmdForward(const std::vector<std::string>& args);
    bool cmdStatus(const std::vector<std::string>& args);
    bool cmdQuit(const std::vector<std::string>& args);

    std::vector<std::string> parseCommandLine(const std::string& cmdLine) const;
    void showHelp() const;
    void reportDirection() const;
};

#endif // REPLAY_BRIDGE_CONSOLE_PROCESSOR_HPP
