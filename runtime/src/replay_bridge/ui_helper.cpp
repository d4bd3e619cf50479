#include "replay_bridge/ui_helper.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <unistd.h>
#include <readline/readline.h>
#include <readline/history.h>

// ANSI color codes
namespace Color {
    const char* RESET   = "\033[0m";
    const char* RED     = "\033[31m";
    const char* GREEN   = "\033[32m";
}

UIHelper* UIHelper::active = nullptr;

UIHelper::UIHelper(const PromptOptions& options) : options(options) {
    if (options.enableCompletion) {
        rl_attempted_completion_function = &UIHelper::commandCompletion;
    }
    if (options.enableHistory) {
        using_history();
        stifle_history(static_cast<int>(options.maxHistorySize));
    }
}

UIHelper::~UIHelper() {
    if (installed) {
        rl_callback_handler_remove();
    }
    if (active == this) {
        active = nullptr;
    }
}

void UIHelper::onLine(char* line) {
    UIHelper* self = active;
    if (!self) {
        std::free(line);
        return;
    }

    if (!line) {
        self->closed = true;
        rl_callback_handler_remove();
        self->installed = false;
        return;
    }

    std::string input(line);
    std::free(line);
    self->addToHistory(input);
    self->pendingLine = input;
}

char* UIHelper::completionGenerator(const char* text, int state) {
    static std::vector<std::string> matches;
    static size_t matchIndex = 0;

    if (state == 0) {
        matches.clear();
        matchIndex = 0;
        if (active && active->completionCallback) {
            matches = active->completionCallback(text);
        }
    }

    if (matchIndex >= matches.size()) {
        return nullptr;
    }
    return strdup(matches[matchIndex++].c_str());
}

char** UIHelper::commandCompletion(const char* text, int, int) {
    rl_attempted_completion_over = 1;
    return rl_completion_matches(text, &UIHelper::completionGenerator);
}

UIHelper::InputStatus UIHelper::readInput(std::string& line, int timeoutMs) {
    if (closed) {
        return InputStatus::CLOSED;
    }
    if (!installed) {
        active = this;
        rl_callback_handler_install(options.prompt.c_str(), &UIHelper::onLine);
        installed = true;
    }

    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int rc = ::poll(&pfd, 1, timeoutMs);
    if (rc == 0 || (rc < 0 && errno == EINTR)) {
        return InputStatus::TIMEOUT;
    }
    if (rc < 0) {
        closed = true;
        return InputStatus::CLOSED;
    }

    rl_callback_read_char();

    if (pendingLine) {
        line = std::move(*pendingLine);
        pendingLine.reset();
        return InputStatus::LINE;
    }
    return closed ? InputStatus::CLOSED : InputStatus::TIMEOUT;
}

void UIHelper::setCompletionCallback(CompletionCallback callback) {
    completionCallback = std::move(callback);
}

void UIHelper::printError(const std::string& message) {
    std::cerr << Color::RED << "Error: " << message << Color::RESET << "\n";
}

void UIHelper::printInfo(const std::string& message) {
    std::cout << Color::GREEN << message << Color::RESET << "\n";
}

void UIHelper::addToHistory(const std::string& input) {
    if (options.enableHistory && !input.empty()) {
        add_history(input.c_str());
    }
}
