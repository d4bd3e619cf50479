#include "replay_bridge/dbgp_codec.hpp"
#include "replay_bridge/fatal_error.hpp"
#include "logger.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>
#include <unistd.h>

const char* const DBGP_XML_HEADER = "<?xml version=\"1.0\" encoding=\"iso-8859-1\"?>\n";

namespace {

const char* const BASE64_ALPHABET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64Value(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream in(line);
    std::string field;
    while (in >> field) {
        fields.push_back(field);
    }
    return fields;
}

}

bool parseDecimalInt(const std::string& text, int& out) {
    size_t first = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (first >= text.size() || !std::isdigit(static_cast<unsigned char>(text[first]))) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

DbgpCommand parseCommand(const std::string& fullCommand, bool reverseMode) {
    DbgpCommand cmd;
    cmd.fullCommand = fullCommand;

    auto components = splitFields(fullCommand);
    if (components.empty()) {
        LOG_DEBUG("Empty command line received");
        cmd.reverse = reverseMode;
        return cmd;
    }

    cmd.command = components[0];
    // Tokens after the verb pair up as "-flag value"; the flag's leading
    // marker is dropped so "--" (the data marker) becomes "-".
    for (size_t i = 1; i < components.size(); i += 2) {
        std::string flag = components[i].substr(1);
        cmd.options[flag] = (i + 1 < components.size()) ? components[i + 1] : "";
    }

    auto seq = cmd.options.find("i");
    if (seq == cmd.options.end()) {
        LOG_DEBUG("No sequence number flag -i in command '", fullCommand, "'. Assuming seq number 0");
    } else if (!parseDecimalInt(seq->second, cmd.seqNum)) {
        REPLAY_BRIDGE_FATAL("parseCommand", "Invalid sequence number '" + seq->second +
                            "' in command '" + fullCommand + "'");
    }

    // -z only overrides the ambient mode when it is exactly 0 or 1
    auto z = cmd.options.find("z");
    if (z != cmd.options.end()) {
        if (z->second == "1") {
            reverseMode = true;
        } else if (z->second == "0") {
            reverseMode = false;
        }
    }
    cmd.reverse = reverseMode;

    return cmd;
}

std::string constructPacket(const std::string& payload) {
    std::string header(DBGP_XML_HEADER);
    std::string packet = std::to_string(header.size() + payload.size());
    packet.push_back('\0');
    packet += header;
    packet += payload;
    packet.push_back('\0');
    return packet;
}

std::string xmlEscape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  escaped += "&amp;"; break;
            case '<':  escaped += "&lt;"; break;
            case '>':  escaped += "&gt;"; break;
            case '"':  escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default:   escaped.push_back(c); break;
        }
    }
    return escaped;
}

std::string base64Encode(const std::string& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        unsigned n = (static_cast<unsigned char>(data[i]) << 16)
                   | (static_cast<unsigned char>(data[i + 1]) << 8)
                   | static_cast<unsigned char>(data[i + 2]);
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back(BASE64_ALPHABET[n & 0x3F]);
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        unsigned n = static_cast<unsigned char>(data[i]) << 16;
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        unsigned n = (static_cast<unsigned char>(data[i]) << 16)
                   | (static_cast<unsigned char>(data[i + 1]) << 8);
        out.push_back(BASE64_ALPHABET[(n >> 18) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 12) & 0x3F]);
        out.push_back(BASE64_ALPHABET[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string base64Decode(const std::string& encoded) {
    std::string out;
    unsigned buffer = 0;
    int bits = 0;

    for (char c : encoded) {
        if (c == '=') break;
        int value = base64Value(c);
        if (value < 0) {
            throw DbgpError(DBGP_E_PARSE, "Invalid base64 data: " + encoded);
        }
        buffer = (buffer << 6) | static_cast<unsigned>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    return out;
}

std::string fileUriToPath(const std::string& uri) {
    const std::string scheme = "file://";
    if (uri.compare(0, scheme.size(), scheme) == 0) {
        return uri.substr(scheme.size());
    }
    return uri;
}

std::string pathToFileUri(const std::string& path) {
    if (path.empty() || path.compare(0, 7, "file://") == 0) {
        return path;
    }
    return "file://" + path;
}

DbgpResponse::DbgpResponse(const std::string& command, int transactionId)
    : command(command), transactionId(transactionId) {}

DbgpResponse& DbgpResponse::attribute(const std::string& name, const std::string& value) {
    attributes.emplace_back(name, value);
    return *this;
}

DbgpResponse& DbgpResponse::attribute(const std::string& name, int value) {
    return attribute(name, std::to_string(value));
}

DbgpResponse& DbgpResponse::child(const std::string& xml) {
    children += xml;
    return *this;
}

std::string DbgpResponse::str() const {
    std::ostringstream ss;
    ss << "<response xmlns=\"urn:debugger_protocol_v1\""
       << " xmlns:xdebug=\"https://xdebug.org/dbgp/xdebug\""
       << " command=\"" << xmlEscape(command) << "\""
       << " transaction_id=\"" << transactionId << "\"";
    for (const auto& [name, value] : attributes) {
        ss << " " << name << "=\"" << xmlEscape(value) << "\"";
    }
    if (children.empty()) {
        ss << "/>";
    } else {
        ss << ">" << children << "</response>";
    }
    return ss.str();
}

std::string errorResponse(const std::string& command, int transactionId,
                          int code, const std::string& message) {
    std::ostringstream error;
    error << "<error code=\"" << code << "\"><message><![CDATA[" << message
          << "]]></message></error>";
    return DbgpResponse(command, transactionId).child(error.str()).str();
}

std::string initPacket(const std::string& appId,
                       const std::string& ideKey,
                       const std::string& language,
                       const std::string& fileUri) {
    std::ostringstream ss;
    ss << "<init xmlns=\"urn:debugger_protocol_v1\""
       << " xmlns:xdebug=\"https://xdebug.org/dbgp/xdebug\""
       << " appid=\"" << xmlEscape(appId) << "\""
       << " idekey=\"" << xmlEscape(ideKey) << "\""
       << " session=\"\""
       << " thread=\"" << getpid() << "\""
       << " parent=\"\""
       << " language=\"" << xmlEscape(language) << "\""
       << " protocol_version=\"1.0\""
       << " fileuri=\"" << xmlEscape(fileUri) << "\"/>";
    return ss.str();
}
