#ifndef REPLAY_BRIDGE_DBGP_CODEC_HPP
#define REPLAY_BRIDGE_DBGP_CODEC_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// XML declaration that precedes every packet sent to the IDE
extern const char* const DBGP_XML_HEADER;

// DBGp error codes used by the command handlers
enum DbgpErrorCode {
    DBGP_E_PARSE = 1,
    DBGP_E_INVALID_OPTIONS = 3,
    DBGP_E_UNIMPLEMENTED = 4,
    DBGP_E_NOT_AVAILABLE = 5,
    DBGP_E_BREAKPOINT_NOT_SET = 200,
    DBGP_E_BREAKPOINT_TYPE = 201,
    DBGP_E_NO_SUCH_BREAKPOINT = 205,
    DBGP_E_EVALUATION = 206,
    DBGP_E_PROPERTY = 300,
    DBGP_E_STACK_DEPTH = 301,
    DBGP_E_INTERNAL = 998
};

// A protocol-local failure of one command. Turned into an error response;
// the session carries on.
class DbgpError : public std::runtime_error {
public:
    DbgpError(int code, const std::string& message)
        : std::runtime_error(message), code(code) {}

    int getCode() const { return code; }

private:
    int code;
};

struct DbgpCommand {
    std::string command;                        // only the verb e.g. stack_get
    std::string fullCommand;                    // the raw line e.g. "stack_get -i 4"
    std::map<std::string, std::string> options; // flag (without '-') -> value
    int seqNum{0};
    bool reverse{false};                        // run against reversed time

    bool hasOption(const std::string& flag) const {
        return options.find(flag) != options.end();
    }
    std::string option(const std::string& flag, const std::string& fallback = "") const {
        auto it = options.find(flag);
        return it != options.end() ? it->second : fallback;
    }
};

// Command line parsing and packet framing
DbgpCommand parseCommand(const std::string& fullCommand, bool reverseMode);
std::string constructPacket(const std::string& payload);

// Optional '-' then decimal digits only, within int range
bool parseDecimalInt(const std::string& text, int& out);

// Encoding helpers
std::string xmlEscape(const std::string& text);
std::string base64Encode(const std::string& data);
std::string base64Decode(const std::string& encoded);
std::string fileUriToPath(const std::string& uri);
std::string pathToFileUri(const std::string& path);

// Builds one <response .../> element
class DbgpResponse {
public:
    DbgpResponse(const std::string& command, int transactionId);

    DbgpResponse& attribute(const std::string& name, const std::string& value);
    DbgpResponse& attribute(const std::string& name, int value);
    DbgpResponse& child(const std::string& xml);

    std::string str() const;

private:
    std::string command;
    int transactionId;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string children;
};

std::string errorResponse(const std::string& command, int transactionId,
                          int code, const std::string& message);

std::string initPacket(const std::string& appId,
                       const std::string& ideKey,
                       const std::string& language,
                       const std::string& fileUri);

#endif // REPLAY_BRIDGE_DBGP_CODEC_HPP
