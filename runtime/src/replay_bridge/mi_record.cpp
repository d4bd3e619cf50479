#include "replay_bridge/mi_record.hpp"
#include <cctype>
#include <sstream>

namespace {

std::string escapeCString(const std::string& text) {
    std::string escaped;
    for (char c : text) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            default:   escaped.push_back(c); break;
        }
    }
    return escaped;
}

}

MiValue MiValue::makeString(const std::string& s) {
    MiValue v;
    v.kind = Kind::STRING;
    v.text = s;
    return v;
}

MiValue MiValue::makeTuple() {
    MiValue v;
    v.kind = Kind::TUPLE;
    return v;
}

MiValue MiValue::makeList() {
    MiValue v;
    v.kind = Kind::LIST;
    return v;
}

const MiValue* MiValue::find(const std::string& name) const {
    for (const auto& [fieldName, value] : fields) {
        if (fieldName == name) {
            return &value;
        }
    }
    return nullptr;
}

std::string MiValue::getString(const std::string& name, const std::string& fallback) const {
    const MiValue* v = find(name);
    return (v && v->isString()) ? v->text : fallback;
}

std::vector<const MiValue*> MiValue::elements() const {
    std::vector<const MiValue*> result;
    for (const auto& item : items) {
        result.push_back(&item);
    }
    for (const auto& field : fields) {
        result.push_back(&field.second);
    }
    return result;
}

MiValue& MiValue::add(const std::string& name, MiValue value) {
    fields.emplace_back(name, std::move(value));
    return *this;
}

MiValue& MiValue::add(const std::string& name, const std::string& value) {
    return add(name, makeString(value));
}

std::string MiValue::toString() const {
    std::ostringstream ss;
    switch (kind) {
        case Kind::STRING:
            ss << '"' << escapeCString(text) << '"';
            break;
        case Kind::TUPLE:
        case Kind::LIST: {
            ss << (kind == Kind::TUPLE ? '{' : '[');
            bool first = true;
            for (const auto& [name, value] : fields) {
                if (!first) ss << ',';
                ss << name << '=' << value.toString();
                first = false;
            }
            for (const auto& item : items) {
                if (!first) ss << ',';
                ss << item.toString();
                first = false;
            }
            ss << (kind == Kind::TUPLE ? '}' : ']');
            break;
        }
    }
    return ss.str();
}

std::string MiRecord::toString() const {
    std::ostringstream ss;
    switch (kind) {
        case Kind::RESULT:       ss << '^'; break;
        case Kind::EXEC_ASYNC:   ss << '*'; break;
        case Kind::STATUS_ASYNC: ss << '+'; break;
        case Kind::NOTIFY_ASYNC: ss << '='; break;
        default:
            return raw;
    }
    ss << recordClass;
    if (!payload.fields.empty()) {
        std::string body = payload.toString();
        ss << ',' << body.substr(1, body.size() - 2);
    }
    return ss.str();
}

namespace {

// Tokens are the bridge's own counters; gdb echoes them back
const size_t MAX_TOKEN_DIGITS = 18;

class MiParser {
public:
    explicit MiParser(const std::string& input) : in(input) {}

    bool atEnd() const { return pos >= in.size(); }
    char peek() const { return atEnd() ? '\0' : in[pos]; }

    bool consume(char c) {
        if (peek() == c) {
            ++pos;
            return true;
        }
        return false;
    }

    // A run of digits too long for a token is left unconsumed, so the line
    // does not start with a record marker and parses as UNKNOWN
    std::optional<long> parseToken() {
        size_t start = pos;
        while (!atEnd() && std::isdigit(static_cast<unsigned char>(in[pos]))) {
            ++pos;
        }
        if (pos == start) return std::nullopt;
        if (pos - start > MAX_TOKEN_DIGITS) {
            pos = start;
            return std::nullopt;
        }
        return std::stol(in.substr(start, pos - start));
    }

    std::string parseIdentifier() {
        size_t start = pos;
        while (!atEnd() && in[pos] != ',' && in[pos] != '=' &&
               in[pos] != '{' && in[pos] != '}' &&
               in[pos] != '[' && in[pos] != ']' && in[pos] != '\r') {
            ++pos;
        }
        return in.substr(start, pos - start);
    }

    bool parseCString(std::string& out) {
        if (!consume('"')) return false;
        out.clear();
        while (!atEnd()) {
            char c = in[pos++];
            if (c == '"') return true;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (atEnd()) return false;
            char e = in[pos++];
            switch (e) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                case 'e': out.push_back('\033'); break;
                case '\\': out.push_back('\\'); break;
                case '"': out.push_back('"'); break;
                default:
                    if (e >= '0' && e <= '7') {
                        int value = e - '0';
                        for (int i = 0; i < 2 && !atEnd() && in[pos] >= '0' && in[pos] <= '7'; ++i) {
                            value = value * 8 + (in[pos++] - '0');
                        }
                        out.push_back(static_cast<char>(value));
                    } else {
                        out.push_back(e);
                    }
                    break;
            }
        }
        return false;  // unterminated
    }

    bool parseValue(MiValue& out) {
        if (peek() == '"') {
            out.kind = MiValue::Kind::STRING;
            return parseCString(out.text);
        }
        if (consume('{')) {
            out = MiValue::makeTuple();
            if (consume('}')) return true;
            do {
                std::string name;
                MiValue value;
                if (!parseResult(name, value)) return false;
                out.fields.emplace_back(std::move(name), std::move(value));
            } while (consume(','));
            return consume('}');
        }
        if (consume('[')) {
            out = MiValue::makeList();
            if (consume(']')) return true;
            do {
                if (peek() == '"' || peek() == '{' || peek() == '[') {
                    MiValue value;
                    if (!parseValue(value)) return false;
                    out.items.push_back(std::move(value));
                } else {
                    std::string name;
                    MiValue value;
                    if (!parseResult(name, value)) return false;
                    out.fields.emplace_back(std::move(name), std::move(value));
                }
            } while (consume(','));
            return consume(']');
        }
        return false;
    }

    bool parseResult(std::string& name, MiValue& value) {
        name = parseIdentifier();
        if (name.empty() || !consume('=')) return false;
        return parseValue(value);
    }

    // ("," result)* into the record payload; stops at the first malformed result
    void parseResults(MiValue& payload) {
        while (consume(',')) {
            std::string name;
            MiValue value;
            if (!parseResult(name, value)) return;
            payload.fields.emplace_back(std::move(name), std::move(value));
        }
    }

    std::string rest() const { return atEnd() ? "" : in.substr(pos); }

private:
    const std::string& in;
    size_t pos{0};
};

}

MiRecord parseMiLine(const std::string& line) {
    MiRecord record;
    record.raw = line;
    if (!record.raw.empty() && record.raw.back() == '\r') {
        record.raw.pop_back();
    }

    if (record.raw.compare(0, 5, "(gdb)") == 0) {
        record.kind = MiRecord::Kind::PROMPT;
        return record;
    }

    MiParser parser(record.raw);
    std::optional<long> token = parser.parseToken();

    char marker = parser.peek();
    switch (marker) {
        case '^': record.kind = MiRecord::Kind::RESULT; break;
        case '*': record.kind = MiRecord::Kind::EXEC_ASYNC; break;
        case '+': record.kind = MiRecord::Kind::STATUS_ASYNC; break;
        case '=': record.kind = MiRecord::Kind::NOTIFY_ASYNC; break;
        case '~': record.kind = MiRecord::Kind::CONSOLE_STREAM; break;
        case '@': record.kind = MiRecord::Kind::TARGET_STREAM; break;
        case '&': record.kind = MiRecord::Kind::LOG_STREAM; break;
        default:
            record.kind = MiRecord::Kind::UNKNOWN;
            return record;
    }
    parser.consume(marker);
    record.token = token;

    if (record.kind == MiRecord::Kind::CONSOLE_STREAM ||
        record.kind == MiRecord::Kind::TARGET_STREAM ||
        record.kind == MiRecord::Kind::LOG_STREAM) {
        if (!parser.parseCString(record.text)) {
            record.text = parser.rest();
        }
        return record;
    }

    record.recordClass = parser.parseIdentifier();
    parser.parseResults(record.payload);
    return record;
}

std::string quoteMiArgument(const std::string& argument) {
    bool needsQuotes = argument.empty();
    for (char c : argument) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\\') {
            needsQuotes = true;
            break;
        }
    }
    if (!needsQuotes) {
        return argument;
    }

    return "\"" + escapeCString(argument) + "\"";
}
