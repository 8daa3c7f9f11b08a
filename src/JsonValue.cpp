#include "JsonValue.h"

#include "SieveExceptions.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>

namespace {
void appendUtf8(std::string& out, unsigned codepoint) {
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

void dumpString(std::ostringstream& out, const std::string& value) {
    out << '"';
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out << buf;
                } else {
                    out << c;
                }
                break;
        }
    }
    out << '"';
}

void dumpNumber(std::ostringstream& out, double v) {
    if (!std::isfinite(v)) {
        out << "null";
        return;
    }
    if (v == std::floor(v) && std::abs(v) < 1e15) {
        out << static_cast<long long>(v);
        return;
    }
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    out.write(buf, res.ptr - buf);
}

void dumpValue(std::ostringstream& out, const JsonValue& value, int indent, int depth) {
    const bool pretty = indent >= 0;
    auto newline = [&](int level) {
        if (!pretty) return;
        out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
    };

    switch (value.type) {
        case JsonValue::Type::Null: out << "null"; return;
        case JsonValue::Type::Bool: out << (value.booleanValue ? "true" : "false"); return;
        case JsonValue::Type::Number: dumpNumber(out, value.numberValue); return;
        case JsonValue::Type::String: dumpString(out, value.stringValue); return;
        case JsonValue::Type::Array: {
            out << '[';
            for (size_t i = 0; i < value.arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                newline(depth + 1);
                dumpValue(out, value.arrayValue[i], indent, depth + 1);
            }
            if (!value.arrayValue.empty()) newline(depth);
            out << ']';
            return;
        }
        case JsonValue::Type::Object: {
            out << '{';
            bool first = true;
            for (const auto& kv : value.objectValue) {
                if (!first) out << ',';
                first = false;
                newline(depth + 1);
                dumpString(out, kv.first);
                out << (pretty ? ": " : ":");
                dumpValue(out, kv.second, indent, depth + 1);
            }
            if (!value.objectValue.empty()) newline(depth);
            out << '}';
            return;
        }
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            throw Sieve::ConfigurationException("Unexpected trailing JSON content at offset " + std::to_string(position));
        }
        return value;
    }

private:
    const std::string& text;
    size_t position = 0;

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            throw Sieve::ConfigurationException("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            throw Sieve::ConfigurationException("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        if (take() != expected) {
            throw Sieve::ConfigurationException(std::string("Expected JSON character '") + expected +
                                                "' at offset " + std::to_string(position - 1));
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == '"') return JsonValue::string(parseString());
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        throw Sieve::ConfigurationException("Invalid JSON token at offset " + std::to_string(position));
    }

    JsonValue parseObject() {
        JsonValue object = JsonValue::object();
        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            std::string key = parseString();
            skipWhitespace();
            expect(':');
            object.objectValue[key] = parseValue();

            skipWhitespace();
            const char next = take();
            if (next == '}') break;
            if (next != ',') throw Sieve::ConfigurationException("Expected ',' or '}' in JSON object");
        }
        return object;
    }

    JsonValue parseArray() {
        JsonValue array = JsonValue::array();
        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = take();
            if (next == ']') break;
            if (next != ',') throw Sieve::ConfigurationException("Expected ',' or ']' in JSON array");
        }
        return array;
    }

    std::string parseString() {
        std::string out;
        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            const char escaped = take();
            switch (escaped) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned codepoint = parseHex4();
                    if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
                        throw Sieve::ConfigurationException("Unpaired low surrogate in JSON string");
                    }
                    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
                        if (text.compare(position, 2, "\\u") != 0) {
                            throw Sieve::ConfigurationException("Unpaired high surrogate in JSON string");
                        }
                        position += 2;
                        const unsigned low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            throw Sieve::ConfigurationException("Unpaired high surrogate in JSON string");
                        }
                        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                    }
                    appendUtf8(out, codepoint);
                    break;
                }
                default:
                    throw Sieve::ConfigurationException("Unsupported escaped character in JSON string");
            }
        }
        return out;
    }

    unsigned parseHex4() {
        if (position + 4 > text.size()) throw Sieve::ConfigurationException("Truncated \\u escape in JSON string");
        unsigned codepoint = 0;
        auto res = std::from_chars(text.data() + position, text.data() + position + 4, codepoint, 16);
        if (res.ptr != text.data() + position + 4) {
            throw Sieve::ConfigurationException("Invalid \\u escape in JSON string");
        }
        position += 4;
        return codepoint;
    }

    JsonValue parseBoolean() {
        if (text.compare(position, 4, "true") == 0) {
            position += 4;
            return JsonValue::boolean(true);
        }
        if (text.compare(position, 5, "false") == 0) {
            position += 5;
            return JsonValue::boolean(false);
        }
        throw Sieve::ConfigurationException("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            throw Sieve::ConfigurationException("Invalid JSON null value");
        }
        position += 4;
        return JsonValue::null();
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();
        auto digits = [&]() {
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) ++position;
        };
        digits();
        if (position < text.size() && text[position] == '.') {
            ++position;
            digits();
        }
        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) ++position;
            digits();
        }

        const std::string token = text.substr(start, position - start);
        char* end = nullptr;
        const double v = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size()) {
            throw Sieve::ConfigurationException("Invalid JSON number '" + token + "'");
        }
        return JsonValue::number(v);
    }
};

const char* typeName(JsonValue::Type type) {
    switch (type) {
        case JsonValue::Type::Null: return "null";
        case JsonValue::Type::Bool: return "boolean";
        case JsonValue::Type::Number: return "number";
        case JsonValue::Type::String: return "string";
        case JsonValue::Type::Array: return "array";
        case JsonValue::Type::Object: return "object";
    }
    return "value";
}
} // namespace

JsonValue JsonValue::boolean(bool v) {
    JsonValue out;
    out.type = Type::Bool;
    out.booleanValue = v;
    return out;
}

JsonValue JsonValue::number(double v) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = v;
    return out;
}

JsonValue JsonValue::string(std::string v) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(v);
    return out;
}

JsonValue JsonValue::array(std::vector<JsonValue> items) {
    JsonValue out;
    out.type = Type::Array;
    out.arrayValue = std::move(items);
    return out;
}

JsonValue JsonValue::object() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    auto it = objectValue.find(key);
    if (it == objectValue.end()) return nullptr;
    return &it->second;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    type = Type::Object;
    return objectValue[key] = std::move(value);
}

const std::string& JsonValue::asString(const std::string& context) const {
    if (!isString()) throw Sieve::ConfigurationException(context + " must be a string, got " + typeName(type));
    return stringValue;
}

double JsonValue::asNumber(const std::string& context) const {
    if (!isNumber()) throw Sieve::ConfigurationException(context + " must be a number, got " + typeName(type));
    return numberValue;
}

bool JsonValue::asBool(const std::string& context) const {
    if (!isBool()) throw Sieve::ConfigurationException(context + " must be a boolean, got " + typeName(type));
    return booleanValue;
}

std::string JsonValue::dump(int indent) const {
    std::ostringstream out;
    dumpValue(out, *this, indent, 0);
    return out.str();
}

bool JsonValue::operator==(const JsonValue& other) const {
    if (type != other.type) return false;
    switch (type) {
        case Type::Null: return true;
        case Type::Bool: return booleanValue == other.booleanValue;
        case Type::Number: return numberValue == other.numberValue;
        case Type::String: return stringValue == other.stringValue;
        case Type::Array: return arrayValue == other.arrayValue;
        case Type::Object: return objectValue == other.objectValue;
    }
    return false;
}

JsonValue parseJson(const std::string& text) {
    return JsonParser(text).parse();
}

JsonValue loadJsonFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Sieve::IOException("Cannot open JSON file '" + path + "'", path);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parseJson(text);
}
