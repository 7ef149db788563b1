#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace json
{
struct JsonValue
{
    enum class Type
    {
        Null,
        Number,
        String,
        Object,
        Array,
        Bool
    };

    Type type = Type::Null;
    double number = 0.0;
    bool boolean = false;
    std::string string;
    std::unordered_map<std::string, JsonValue> object;
    std::vector<JsonValue> array;

    static JsonValue makeObject();
    static JsonValue makeArray();
    static JsonValue makeString(std::string value);
    static JsonValue makeNumber(double value);
    static JsonValue makeBool(bool value);

    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }

    JsonValue &set(const std::string &key, JsonValue value);
};

struct JsonParseError
{
    std::size_t offset = 0;
    std::string message;
};

class JsonParser
{
  public:
    explicit JsonParser(const std::string &src) : m_text(src) {}

    std::optional<JsonValue> parse();

    const JsonParseError &error() const { return m_error; }

  private:
    void skipWhitespace();
    std::optional<JsonValue> fail(const char *message);

    std::optional<JsonValue> parseValue(int depth);
    std::optional<JsonValue> parseLiteral();
    std::optional<JsonValue> parseNumber();
    std::optional<JsonValue> parseString();
    std::optional<JsonValue> parseArray(int depth);
    std::optional<JsonValue> parseObject(int depth);
    bool parseUnicodeEscape(std::string &out);

    const std::string &m_text;
    std::size_t m_pos = 0;
    JsonParseError m_error{};
};

std::optional<JsonValue> parseJson(const std::string &text, JsonParseError *error = nullptr);

// Object keys are written in sorted order so repeated writes of equal values are byte-identical.
std::string serializeJson(const JsonValue &value, bool pretty = false);

const JsonValue *getObjectField(const JsonValue &obj, const std::string &key);

bool hasNumber(const JsonValue &obj, const std::string &key);
double getDouble(const JsonValue &obj, const std::string &key, double fallback);
int getInt(const JsonValue &obj, const std::string &key, int fallback);
std::int64_t getInt64(const JsonValue &obj, const std::string &key, std::int64_t fallback);
bool getBool(const JsonValue &obj, const std::string &key, bool fallback);
std::string getString(const JsonValue &obj, const std::string &key, std::string fallback);
std::vector<std::string> getStringArray(const JsonValue &obj, const std::string &key);

} // namespace json
