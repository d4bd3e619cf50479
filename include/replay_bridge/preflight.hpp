#ifndef REPLAY_BRIDGE_PREFLIGHT_HPP
#define REPLAY_BRIDGE_PREFLIGHT_HPP

#include <string>

struct Version {
    int major{0};
    int minor{0};
    int patch{0};

    bool operator<(const Version& other) const;
    bool operator>=(const Version& other) const { return !(*this < other); }
    std::string toString() const;
};

// Absolute path of an executable found on PATH (or the name itself when it
// already contains a '/' and is executable); empty if not found
std::string findExecutable(const std::string& name);

// Absolute path with symlinks and "." / ".." resolved. Raises FatalError
// naming the path (described by what) when it does not exist.
std::string resolveExistingPath(const std::string& path, const std::string& what);

// First line printed by `<path> --version`. False if it could not be run.
bool readVersionLine(const std::string& path, std::string& line);

// Finds the first "major.minor[.patch]" in text. A missing patch reads as 0.
bool parseVersion(const std::string& text, Version& out);

// Each returns the resolved path, or raises FatalError when the executable
// is missing or its version is unsupported
std::string checkGdbExecutable(const std::string& gdbExecutable);       // >= 7.11.1
std::string checkRrExecutable(const std::string& rrExecutable);         // >= 4.3.0
std::string checkRuntimeExecutable(const std::string& runtimeExecutable); // 7.0.x

// Version-only parts of the checks above, for a given --version line
bool gdbVersionSupported(const std::string& versionLine, Version& found);
bool rrVersionSupported(const std::string& versionLine, Version& found);
bool runtimeVersionSupported(const std::string& versionLine, Version& found);

#endif // REPLAY_BRIDGE_PREFLIGHT_HPP
