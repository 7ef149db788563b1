#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct TelemetrySettings
{
    std::filesystem::path directory{"logs"};
    // A session file is closed and a new one started once it reaches this size; 0 disables rotation.
    std::uintmax_t rotationBytes = 4ull * 1024ull * 1024ull;
    // Oldest session files beyond this count are deleted; 0 keeps everything.
    std::size_t maxFiles = 10;
};

class TelemetrySink
{
  public:
    using Payload = std::unordered_map<std::string, std::string>;

    virtual ~TelemetrySink() = default;

    virtual void recordEvent(std::string_view eventName, const Payload &payload) = 0;
    virtual void flush() {}
};

class NullTelemetrySink : public TelemetrySink
{
  public:
    void recordEvent(std::string_view, const Payload &) override {}
};

// Hands every record to each sink in order. Null entries are skipped.
class FanoutTelemetrySink : public TelemetrySink
{
  public:
    explicit FanoutTelemetrySink(std::vector<std::shared_ptr<TelemetrySink>> sinks);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

  private:
    std::vector<std::shared_ptr<TelemetrySink>> m_sinks;
};

namespace telemetry
{

// Null-safe emit used by components that hold an optional sink.
inline void emit(const std::shared_ptr<TelemetrySink> &sink, std::string_view eventName, const TelemetrySink::Payload &payload)
{
    if (sink)
    {
        sink->recordEvent(eventName, payload);
    }
}

std::int64_t wallClockMs();
// strftime-style local time of the given wall clock instant.
std::string formatLocalTime(std::int64_t epochMs, const char *format);

} // namespace telemetry
