#ifndef REPLAY_BRIDGE_UI_HELPER_HPP
#define REPLAY_BRIDGE_UI_HELPER_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>

// Readline prompt on the bridge's own terminal. Input is polled so the
// console thread can be asked to finish while no line is being typed.
class UIHelper {
public:
    struct PromptOptions {
        std::string prompt;
        bool enableHistory;
        bool enableCompletion;
        size_t maxHistorySize;

        PromptOptions()
            : prompt("(replay-bridge) ")
            , enableHistory(true)
            , enableCompletion(true)
            , maxHistorySize(1000)
        {}

        PromptOptions(const std::string& p, bool eHist, bool eComp, size_t maxHist)
            : prompt(p)
            , enableHistory(eHist)
            , enableCompletion(eComp)
            , maxHistorySize(maxHist)
        {}
    };

    enum class InputStatus {
        LINE,       // a complete line was read
        TIMEOUT,    // nothing complete yet
        CLOSED      // end of input
    };

    using CompletionCallback = std::function<std::vector<std::string>(const std::string&)>;

    explicit UIHelper(const PromptOptions& options = PromptOptions());
    ~UIHelper();

    UIHelper(const UIHelper&) = delete;
    UIHelper& operator=(const UIHelper&) = delete;

    // Waits up to timeoutMs for a line
    InputStatus readInput(std::string& line, int timeoutMs);
    void setCompletionCallback(CompletionCallback callback);

    void printError(const std::string& message);
    void printInfo(const std::string& message);


private:
    PromptOptions options;
    CompletionCallback completionCallback;
    bool installed{false};
    bool closed{false};
    std::optional<std::string> pendingLine;

    static UIHelper* active;    // readline has one global line handler
    static void onLine(char* line);
    static char* completionGenerator(const char* text, int state);
    static char** commandCompletion(const char* text, int start, int end);

    void addToHistory(const std::string& input);
};

#endif // REPLAY_BRIDGE_UI_HELPER_HPP
