#include "telemetry/TelemetrySink.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

FanoutTelemetrySink::FanoutTelemetrySink(std::vector<std::shared_ptr<TelemetrySink>> sinks) : m_sinks(std::move(sinks)) {}

void FanoutTelemetrySink::recordEvent(std::string_view eventName, const Payload &payload)
{
    for (const auto &sink : m_sinks)
    {
        telemetry::emit(sink, eventName, payload);
    }
}

void FanoutTelemetrySink::flush()
{
    for (const auto &sink : m_sinks)
    {
        if (sink)
        {
            sink->flush();
        }
    }
}

namespace telemetry
{

std::int64_t wallClockMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string formatLocalTime(std::int64_t epochMs, const char *format)
{
    const std::time_t raw = static_cast<std::time_t>(epochMs / 1000);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &raw);
#else
    localtime_r(&raw, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, format);
    return oss.str();
}

} // namespace telemetry
