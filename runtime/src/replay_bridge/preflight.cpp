#include "replay_bridge/preflight.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <stdexcept>
#include <sstream>
#include <unistd.h>

namespace {

std::string lastToken(const std::string& line) {
    std::istringstream iss(line);
    std::string token, last;
    while (iss >> token) last = token;
    return last;
}

std::string secondToken(const std::string& line) {
    std::istringstream iss(line);
    std::string first, second;
    iss >> first >> second;
    return second;
}

std::string shellQuote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    return quoted + "'";
}

std::string resolveWithVersion(const std::string& executable, const char* what, std::string& versionLine) {
    std::string path = findExecutable(executable);
    if (path.empty()) {
        REPLAY_BRIDGE_FATAL("preflight", "Could not find " + executable + " (" + what + ") on PATH");
    }
    LOG_INFO("Using ", what, " from path ", path);

    if (!readVersionLine(path, versionLine)) {
        REPLAY_BRIDGE_FATAL("preflight", "Could not run " + path + " --version");
    }
    LOG_DEBUG(what, " version line: ", versionLine);
    return path;
}

}

bool Version::operator<(const Version& other) const {
    if (major != other.major) return major < other.major;
    if (minor != other.minor) return minor < other.minor;
    return patch < other.patch;
}

std::string resolveExistingPath(const std::string& path, const std::string& what) {
    char* resolved = realpath(path.c_str(), nullptr);
    if (!resolved) {
        REPLAY_BRIDGE_FATAL("preflight", "Cannot use " + what + " " + path + ": " + std::strerror(errno));
    }
    std::string absolute(resolved);
    free(resolved);
    LOG_DEBUG(what, " ", path, " resolves to ", absolute);
    return absolute;
}

std::string Version::toString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::string findExecutable(const std::string& name) {
    if (name.empty()) return "";

    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::istringstream dirs(pathEnv);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

bool readVersionLine(const std::string& path, std::string& line) {
    std::string command = shellQuote(path) + " --version 2>/dev/null";
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) return false;

    char buffer[512];
    line.clear();
    bool gotLine = fgets(buffer, sizeof(buffer), pipe) != nullptr;
    if (gotLine) {
        line = buffer;
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        // Let the program finish writing
        while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {}
    }

    int status = pclose(pipe);
    return gotLine && status == 0;
}

bool parseVersion(const std::string& text, Version& out) {
    static const std::regex pattern(R"((\d+)\.(\d+)(?:\.(\d+))?)");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return false;
    }
    try {
        out.major = std::stoi(match[1].str());
        out.minor = std::stoi(match[2].str());
        out.patch = match[3].matched ? std::stoi(match[3].str()) : 0;
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool gdbVersionSupported(const std::string& versionLine, Version& found) {
    // "GNU gdb (GDB) 7.12.1": the version is the last word
    if (!parseVersion(lastToken(versionLine), found)) return false;
    return found >= Version{7, 11, 1};
}

bool rrVersionSupported(const std::string& versionLine, Version& found) {
    // "rr version 5.5.0"
    if (!parseVersion(lastToken(versionLine), found)) return false;
    return found >= Version{4, 3, 0};
}

bool runtimeVersionSupported(const std::string& versionLine, Version& found) {
    // "PHP 7.0.33-0ubuntu0.16.04.1 (cli) ( NTS )": only an exact leading
    // major.minor.patch counts
    static const std::regex leading(R"(^\d+\.\d+\.\d+)");
    std::smatch match;
    std::string token = secondToken(versionLine);
    if (!std::regex_search(token, match, leading)) return false;
    if (!parseVersion(match.str(), found)) return false;
    return found.major == 7 && found.minor == 0;
}

std::string checkGdbExecutable(const std::string& gdbExecutable) {
    std::string versionLine;
    std::string path = resolveWithVersion(gdbExecutable, "gdb", versionLine);
    Version found;
    if (!gdbVersionSupported(versionLine, found)) {
        REPLAY_BRIDGE_FATAL("preflight", "Only gdb >= 7.11.1 supported. Version line was: " + versionLine);
    }
    return path;
}

std::string checkRrExecutable(const std::string& rrExecutable) {
    std::string versionLine;
    std::string path = resolveWithVersion(rrExecutable, "rr", versionLine);
    Version found;
    if (!rrVersionSupported(versionLine, found)) {
        REPLAY_BRIDGE_FATAL("preflight", "Only rr >= 4.3.0 supported. Version line was: " + versionLine);
    }
    return path;
}

std::string checkRuntimeExecutable(const std::string& runtimeExecutable) {
    std::string versionLine;
    std::string path = resolveWithVersion(runtimeExecutable, "runtime", versionLine);
    Version found;
    if (!runtimeVersionSupported(versionLine, found)) {
        REPLAY_BRIDGE_FATAL("preflight", "Only 7.0.x runtimes supported. Version line was: " + versionLine);
    }
    return path;
}
