#include "json/JsonUtils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <utility>

namespace json
{

namespace
{

constexpr int kMaxDepth = 64;

void appendUtf8(std::string &out, std::uint32_t code)
{
    if (code <= 0x7F)
    {
        out.push_back(static_cast<char>(code));
    }
    else if (code <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    else if (code <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

std::optional<std::uint32_t> readHex4(const std::string &text, std::size_t pos)
{
    if (pos + 4 > text.size())
    {
        return std::nullopt;
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i)
    {
        const char c = text[pos + i];
        value <<= 4;
        if (c >= '0' && c <= '9')
        {
            value |= static_cast<std::uint32_t>(c - '0');
        }
        else if (c >= 'a' && c <= 'f')
        {
            value |= static_cast<std::uint32_t>(c - 'a' + 10);
        }
        else if (c >= 'A' && c <= 'F')
        {
            value |= static_cast<std::uint32_t>(c - 'A' + 10);
        }
        else
        {
            return std::nullopt;
        }
    }
    return value;
}

void writeEscaped(std::ostringstream &oss, const std::string &value)
{
    oss << '"';
    for (char ch : value)
    {
        switch (ch)
        {
        case '\\': oss << "\\\\"; break;
        case '"': oss << "\\\""; break;
        case '\n': oss << "\\n"; break;
        case '\r': oss << "\\r"; break;
        case '\t': oss << "\\t"; break;
        case '\b': oss << "\\b"; break;
        case '\f': oss << "\\f"; break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
            {
                oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(ch)) << std::dec << std::nouppercase;
            }
            else
            {
                oss << ch;
            }
            break;
        }
    }
    oss << '"';
}

void writeNumber(std::ostringstream &oss, double number)
{
    if (!std::isfinite(number))
    {
        oss << "null";
        return;
    }
    double integral = 0.0;
    if (std::modf(number, &integral) == 0.0 && std::fabs(number) < 9.0e15)
    {
        oss << static_cast<long long>(number);
        return;
    }
    std::ostringstream tmp;
    tmp << std::setprecision(17) << number;
    oss << tmp.str();
}

void writeValue(std::ostringstream &oss, const JsonValue &value, bool pretty, int indent)
{
    const auto newline = [&](int level) {
        if (pretty)
        {
            oss << '\n' << std::string(static_cast<std::size_t>(level) * 2, ' ');
        }
    };

    switch (value.type)
    {
    case JsonValue::Type::Null:
        oss << "null";
        break;
    case JsonValue::Type::Bool:
        oss << (value.boolean ? "true" : "false");
        break;
    case JsonValue::Type::Number:
        writeNumber(oss, value.number);
        break;
    case JsonValue::Type::String:
        writeEscaped(oss, value.string);
        break;
    case JsonValue::Type::Array:
    {
        oss << '[';
        bool first = true;
        for (const JsonValue &elem : value.array)
        {
            if (!first)
            {
                oss << ',';
            }
            first = false;
            newline(indent + 1);
            writeValue(oss, elem, pretty, indent + 1);
        }
        if (!value.array.empty())
        {
            newline(indent);
        }
        oss << ']';
        break;
    }
    case JsonValue::Type::Object:
    {
        std::vector<const std::pair<const std::string, JsonValue> *> entries;
        entries.reserve(value.object.size());
        for (const auto &entry : value.object)
        {
            entries.push_back(&entry);
        }
        std::sort(entries.begin(), entries.end(), [](const auto *a, const auto *b) { return a->first < b->first; });

        oss << '{';
        bool first = true;
        for (const auto *entry : entries)
        {
            if (!first)
            {
                oss << ',';
            }
            first = false;
            newline(indent + 1);
            writeEscaped(oss, entry->first);
            oss << (pretty ? ": " : ":");
            writeValue(oss, entry->second, pretty, indent + 1);
        }
        if (!entries.empty())
        {
            newline(indent);
        }
        oss << '}';
        break;
    }
    }
}

} // namespace

JsonValue JsonValue::makeObject()
{
    JsonValue v;
    v.type = Type::Object;
    return v;
}

JsonValue JsonValue::makeArray()
{
    JsonValue v;
    v.type = Type::Array;
    return v;
}

JsonValue JsonValue::makeString(std::string value)
{
    JsonValue v;
    v.type = Type::String;
    v.string = std::move(value);
    return v;
}

JsonValue JsonValue::makeNumber(double value)
{
    JsonValue v;
    v.type = Type::Number;
    v.number = value;
    return v;
}

JsonValue JsonValue::makeBool(bool value)
{
    JsonValue v;
    v.type = Type::Bool;
    v.boolean = value;
    return v;
}

JsonValue &JsonValue::set(const std::string &key, JsonValue value)
{
    type = Type::Object;
    object[key] = std::move(value);
    return *this;
}

std::optional<JsonValue> JsonParser::parse()
{
    m_pos = 0;
    m_error = {};
    skipWhitespace();
    auto value = parseValue(0);
    if (!value.has_value())
    {
        return std::nullopt;
    }
    skipWhitespace();
    if (m_pos != m_text.size())
    {
        return fail("Trailing characters after document");
    }
    return value;
}

void JsonParser::skipWhitespace()
{
    while (m_pos < m_text.size())
    {
        const char c = m_text[m_pos];
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t')
        {
            ++m_pos;
        }
        else
        {
            break;
        }
    }
}

std::optional<JsonValue> JsonParser::fail(const char *message)
{
    if (m_error.message.empty())
    {
        m_error.offset = m_pos;
        m_error.message = message;
    }
    return std::nullopt;
}

std::optional<JsonValue> JsonParser::parseValue(int depth)
{
    if (depth > kMaxDepth)
    {
        return fail("Nesting too deep");
    }
    if (m_pos >= m_text.size())
    {
        return fail("Unexpected end of input");
    }
    const char c = m_text[m_pos];
    if (c == 'n' || c == 't' || c == 'f')
    {
        return parseLiteral();
    }
    if (c == '"')
    {
        return parseString();
    }
    if (c == '{')
    {
        return parseObject(depth + 1);
    }
    if (c == '[')
    {
        return parseArray(depth + 1);
    }
    if (c == '-' || (c >= '0' && c <= '9'))
    {
        return parseNumber();
    }
    return fail("Unexpected character");
}

std::optional<JsonValue> JsonParser::parseLiteral()
{
    if (m_text.compare(m_pos, 4, "null") == 0)
    {
        m_pos += 4;
        return JsonValue{};
    }
    if (m_text.compare(m_pos, 4, "true") == 0)
    {
        m_pos += 4;
        return JsonValue::makeBool(true);
    }
    if (m_text.compare(m_pos, 5, "false") == 0)
    {
        m_pos += 5;
        return JsonValue::makeBool(false);
    }
    return fail("Invalid literal");
}

std::optional<JsonValue> JsonParser::parseNumber()
{
    const std::size_t start = m_pos;
    if (m_text[m_pos] == '-')
    {
        ++m_pos;
    }
    const std::size_t digitsStart = m_pos;
    while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
    {
        ++m_pos;
    }
    if (m_pos == digitsStart)
    {
        return fail("Number without digits");
    }
    if (m_pos < m_text.size() && m_text[m_pos] == '.')
    {
        ++m_pos;
        const std::size_t fractionStart = m_pos;
        while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
        {
            ++m_pos;
        }
        if (m_pos == fractionStart)
        {
            return fail("Number with empty fraction");
        }
    }
    if (m_pos < m_text.size() && (m_text[m_pos] == 'e' || m_text[m_pos] == 'E'))
    {
        ++m_pos;
        if (m_pos < m_text.size() && (m_text[m_pos] == '+' || m_text[m_pos] == '-'))
        {
            ++m_pos;
        }
        const std::size_t exponentStart = m_pos;
        while (m_pos < m_text.size() && std::isdigit(static_cast<unsigned char>(m_text[m_pos])))
        {
            ++m_pos;
        }
        if (m_pos == exponentStart)
        {
            return fail("Number with empty exponent");
        }
    }

    const std::string token = m_text.substr(start, m_pos - start);
    char *end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str())
    {
        return fail("Invalid number");
    }
    return JsonValue::makeNumber(value);
}

bool JsonParser::parseUnicodeEscape(std::string &out)
{
    const auto first = readHex4(m_text, m_pos);
    if (!first)
    {
        return false;
    }
    m_pos += 4;
    std::uint32_t code = *first;
    if (code >= 0xD800 && code <= 0xDBFF)
    {
        if (m_pos + 6 <= m_text.size() && m_text[m_pos] == '\\' && m_text[m_pos + 1] == 'u')
        {
            const auto low = readHex4(m_text, m_pos + 2);
            if (low && *low >= 0xDC00 && *low <= 0xDFFF)
            {
                m_pos += 6;
                code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
            }
        }
    }
    appendUtf8(out, code);
    return true;
}

std::optional<JsonValue> JsonParser::parseString()
{
    if (m_text[m_pos] != '"')
    {
        return fail("Expected string");
    }
    ++m_pos;
    std::string result;
    while (m_pos < m_text.size())
    {
        const char c = m_text[m_pos++];
        if (c == '"')
        {
            return JsonValue::makeString(std::move(result));
        }
        if (c != '\\')
        {
            result.push_back(c);
            continue;
        }
        if (m_pos >= m_text.size())
        {
            break;
        }
        const char escaped = m_text[m_pos++];
        switch (escaped)
        {
        case '"': result.push_back('"'); break;
        case '\\': result.push_back('\\'); break;
        case '/': result.push_back('/'); break;
        case 'b': result.push_back('\b'); break;
        case 'f': result.push_back('\f'); break;
        case 'n': result.push_back('\n'); break;
        case 'r': result.push_back('\r'); break;
        case 't': result.push_back('\t'); break;
        case 'u':
            if (!parseUnicodeEscape(result))
            {
                return fail("Invalid unicode escape");
            }
            break;
        default:
            return fail("Invalid escape sequence");
        }
    }
    return fail("Unterminated string");
}

std::optional<JsonValue> JsonParser::parseArray(int depth)
{
    ++m_pos;
    JsonValue arrayValue = JsonValue::makeArray();
    skipWhitespace();
    if (m_pos < m_text.size() && m_text[m_pos] == ']')
    {
        ++m_pos;
        return arrayValue;
    }
    while (m_pos < m_text.size())
    {
        skipWhitespace();
        auto value = parseValue(depth);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        arrayValue.array.push_back(std::move(*value));
        skipWhitespace();
        if (m_pos < m_text.size() && m_text[m_pos] == ',')
        {
            ++m_pos;
            continue;
        }
        if (m_pos < m_text.size() && m_text[m_pos] == ']')
        {
            ++m_pos;
            return arrayValue;
        }
        return fail("Expected ',' or ']'");
    }
    return fail("Unterminated array");
}

std::optional<JsonValue> JsonParser::parseObject(int depth)
{
    ++m_pos;
    JsonValue objValue = JsonValue::makeObject();
    skipWhitespace();
    if (m_pos < m_text.size() && m_text[m_pos] == '}')
    {
        ++m_pos;
        return objValue;
    }
    while (m_pos < m_text.size())
    {
        skipWhitespace();
        if (m_pos >= m_text.size() || m_text[m_pos] != '"')
        {
            return fail("Expected object key");
        }
        auto key = parseString();
        if (!key.has_value())
        {
            return std::nullopt;
        }
        skipWhitespace();
        if (m_pos >= m_text.size() || m_text[m_pos] != ':')
        {
            return fail("Expected ':'");
        }
        ++m_pos;
        skipWhitespace();
        auto value = parseValue(depth);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        objValue.object[std::move(key->string)] = std::move(*value);
        skipWhitespace();
        if (m_pos < m_text.size() && m_text[m_pos] == ',')
        {
            ++m_pos;
            continue;
        }
        if (m_pos < m_text.size() && m_text[m_pos] == '}')
        {
            ++m_pos;
            return objValue;
        }
        return fail("Expected ',' or '}'");
    }
    return fail("Unterminated object");
}

std::optional<JsonValue> parseJson(const std::string &text, JsonParseError *error)
{
    JsonParser parser(text);
    auto value = parser.parse();
    if (!value && error)
    {
        *error = parser.error();
    }
    return value;
}

std::string serializeJson(const JsonValue &value, bool pretty)
{
    std::ostringstream oss;
    writeValue(oss, value, pretty, 0);
    if (pretty)
    {
        oss << '\n';
    }
    return oss.str();
}

const JsonValue *getObjectField(const JsonValue &obj, const std::string &key)
{
    if (obj.type != JsonValue::Type::Object)
    {
        return nullptr;
    }
    auto it = obj.object.find(key);
    if (it == obj.object.end())
    {
        return nullptr;
    }
    return &it->second;
}

bool hasNumber(const JsonValue &obj, const std::string &key)
{
    const JsonValue *value = getObjectField(obj, key);
    return value && value->type == JsonValue::Type::Number;
}

double getDouble(const JsonValue &obj, const std::string &key, double fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Number)
        {
            return value->number;
        }
        if (value->type == JsonValue::Type::String && !value->string.empty())
        {
            char *end = nullptr;
            const double parsed = std::strtod(value->string.c_str(), &end);
            if (end && *end == '\0')
            {
                return parsed;
            }
        }
    }
    return fallback;
}

int getInt(const JsonValue &obj, const std::string &key, int fallback)
{
    const std::int64_t value = getInt64(obj, key, fallback);
    return static_cast<int>(std::clamp<std::int64_t>(value, std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}

// Out-of-range numbers saturate instead of overflowing the cast.
std::int64_t getInt64(const JsonValue &obj, const std::string &key, std::int64_t fallback)
{
    const double value = getDouble(obj, key, std::nan(""));
    if (std::isnan(value))
    {
        return fallback;
    }
    constexpr double kUpper = 9223372036854775808.0;
    if (value >= kUpper)
    {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (value < -kUpper)
    {
        return std::numeric_limits<std::int64_t>::min();
    }
    return static_cast<std::int64_t>(value);
}

bool getBool(const JsonValue &obj, const std::string &key, bool fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Bool)
        {
            return value->boolean;
        }
    }
    return fallback;
}

std::string getString(const JsonValue &obj, const std::string &key, std::string fallback)
{
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::String)
        {
            return value->string;
        }
    }
    return fallback;
}

std::vector<std::string> getStringArray(const JsonValue &obj, const std::string &key)
{
    std::vector<std::string> result;
    if (const JsonValue *value = getObjectField(obj, key))
    {
        if (value->type == JsonValue::Type::Array)
        {
            for (const JsonValue &elem : value->array)
            {
                if (elem.type == JsonValue::Type::String)
                {
                    result.push_back(elem.string);
                }
            }
        }
        else if (value->type == JsonValue::Type::String)
        {
            result.push_back(value->string);
        }
    }
    return result;
}

} // namespace json
