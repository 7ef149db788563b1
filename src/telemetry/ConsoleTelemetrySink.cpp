#include "telemetry/ConsoleTelemetrySink.h"

#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace
{

std::string quoteIfNeeded(const std::string &value)
{
    if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos)
    {
        return value;
    }
    std::string out = "\"";
    for (char ch : value)
    {
        if (ch == '"' || ch == '\\')
        {
            out.push_back('\\');
        }
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

} // namespace

ConsoleTelemetrySink::ConsoleTelemetrySink() : ConsoleTelemetrySink(std::cerr) {}

ConsoleTelemetrySink::ConsoleTelemetrySink(std::ostream &stream) : m_stream(stream) {}

void ConsoleTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    const std::int64_t now = telemetry::wallClockMs();
    const std::map<std::string, std::string> ordered(payload.begin(), payload.end());

    std::ostringstream line;
    line << '[' << telemetry::formatLocalTime(now, "%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << (now % 1000) << "] " << eventName;
    for (const auto &[key, value] : ordered)
    {
        line << ' ' << key << '=' << quoteIfNeeded(value);
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << line.str();
}

void ConsoleTelemetrySink::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream.flush();
}
