#pragma once

#include <map>
#include <string>
#include <vector>

/**
 * @brief Minimal JSON document model used for the suggestion/action wire format.
 * @details Object keys are kept sorted so dump() output is stable across runs.
 */
struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    static JsonValue null() { return JsonValue{}; }
    static JsonValue boolean(bool v);
    static JsonValue number(double v);
    static JsonValue string(std::string v);
    static JsonValue array(std::vector<JsonValue> items = {});
    static JsonValue object();

    bool isNull() const noexcept { return type == Type::Null; }
    bool isBool() const noexcept { return type == Type::Bool; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }

    const JsonValue* find(const std::string& key) const;
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * @throws Sieve::ConfigurationException naming `context` on a type mismatch.
     */
    const std::string& asString(const std::string& context) const;
    double asNumber(const std::string& context) const;
    bool asBool(const std::string& context) const;

    std::string dump(int indent = -1) const;

    bool operator==(const JsonValue& other) const;
    bool operator!=(const JsonValue& other) const { return !(*this == other); }
};

/**
 * @throws Sieve::ConfigurationException on malformed input.
 */
JsonValue parseJson(const std::string& text);

/**
 * @throws Sieve::IOException when the file cannot be read.
 */
JsonValue loadJsonFile(const std::string& path);
