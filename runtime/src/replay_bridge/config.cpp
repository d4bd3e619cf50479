#include "replay_bridge/config.hpp"
#include "logger.hpp"
#include <fstream>
#include <sstream>

namespace {

void trim(std::string& text) {
    text.erase(0, text.find_first_not_of(" \t\r"));
    text.erase(text.find_last_not_of(" \t\r") + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::set<std::string> parseList(const std::string& value) {
    std::set<std::string> items;
    std::string item;
    std::istringstream iss(value);
    while (std::getline(iss, item, ',')) {
        trim(item);
        if (!item.empty()) items.insert(item);
    }
    return items;
}

std::string joinList(const std::set<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) joined += ", ";
        joined += item;
    }
    return joined;
}

}

bool BridgeConfig::loadFromFile(const std::string& filename) {
    try {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open config file: ", filename);
            return false;
        }

        resetToDefaults();

        std::string line;
        std::string currentSection;

        while (std::getline(file, line)) {
            trim(line);
            // Skip empty lines and comments
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line[0] == '[' && line.back() == ']') {
                currentSection = line.substr(1, line.size() - 2);
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                LOG_WARNING("Ignoring config line without '=': ", line);
                continue;
            }

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trim(key);
            trim(value);
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }

            if (currentSection == "ide") {
                if (key == "host") ideConfig.host = value;
                else if (key == "port") ideConfig.port = std::stoi(value);
                else if (key == "idekey") ideConfig.ideKey = value;
            }
            else if (currentSection == "replay") {
                if (key == "trace_dir") replayConfig.traceDir = value;
                else if (key == "rr_executable") replayConfig.rrExecutable = value;
                else if (key == "gdb_executable") replayConfig.gdbExecutable = value;
                else if (key == "replay_port") replayConfig.replayPort = std::stoi(value);
                else if (key == "entry_file") replayConfig.entryFile = value;
            }
            else if (currentSection == "session") {
                if (key == "language") sessionConfig.language = value;
                else if (key == "start_reverse") sessionConfig.startReverse = parseBool(value);
                else if (key == "noisy_commands") sessionConfig.noisyCommands = parseList(value);
            }
            else if (currentSection == "trace") {
                if (key == "log_level") traceConfig.logLevel = value;
                else if (key == "color") traceConfig.color = parseBool(value);
                else if (key == "show_notifications") traceConfig.showNotifications = parseBool(value);
            }
            else if (currentSection == "console") {
                if (key == "enabled") consoleConfig.enabled = parseBool(value);
                else if (key == "prompt") consoleConfig.prompt = value;
                else if (key == "enable_history") consoleConfig.enableHistory = parseBool(value);
                else if (key == "max_history") consoleConfig.maxHistorySize = std::stoull(value);
            }
            else if (currentSection == "preflight") {
                if (key == "runtime_executable") preflightConfig.runtimeExecutable = value;
            }
        }

        return true;
    }
    catch (const std::exception& e) {
        LOG_ERROR("Error loading config ", filename, ": ", e.what());
        return false;
    }
}

bool BridgeConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open config file for writing: ", filename);
        return false;
    }

    file << "[ide]\n";
    file << "host = " << ideConfig.host << "\n";
    file << "port = " << ideConfig.port << "\n";
    file << "idekey = " << ideConfig.ideKey << "\n\n";

    file << "[replay]\n";
    file << "trace_dir = " << replayConfig.traceDir << "\n";
    file << "rr_executable = " << replayConfig.rrExecutable << "\n";
    file << "gdb_executable = " << replayConfig.gdbExecutable << "\n";
    file << "replay_port = " << replayConfig.replayPort << "\n";
    file << "entry_file = " << replayConfig.entryFile << "\n\n";

    file << "[session]\n";
    file << "language = " << sessionConfig.language << "\n";
    file << "start_reverse = " << (sessionConfig.startReverse ? "true" : "false") << "\n";
    file << "noisy_commands = " << joinList(sessionConfig.noisyCommands) << "\n\n";

    file << "[trace]\n";
    file << "log_level = " << traceConfig.logLevel << "\n";
    file << "color = " << (traceConfig.color ? "true" : "false") << "\n";
    file << "show_notifications = " << (traceConfig.showNotifications ? "true" : "false") << "\n\n";

    file << "[console]\n";
    file << "enabled = " << (consoleConfig.enabled ? "true" : "false") << "\n";
    // Quoted: the prompt usually ends in a space
    file << "prompt = \"" << consoleConfig.prompt << "\"\n";
    file << "enable_history = " << (consoleConfig.enableHistory ? "true" : "false") << "\n";
    file << "max_history = " << consoleConfig.maxHistorySize << "\n\n";

    file << "[preflight]\n";
    file << "runtime_executable = " << preflightConfig.runtimeExecutable << "\n";

    return file.good();
}

void BridgeConfig::resetToDefaults() {
    ideConfig = IdeConfig();
    replayConfig = ReplayConfig();
    sessionConfig = SessionConfig();
    traceConfig = TraceConfig();
    consoleConfig = ConsoleConfig();
    preflightConfig = PreflightConfig();
}
