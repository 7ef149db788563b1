#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "telemetry/TelemetrySink.h"

// Appends JSON lines to session files named iris_<local time>_<n>.jsonl. Every record carries
// "event", "seq" and "ts_ms". While no file can be written, records go to the fallback sink.
class FileTelemetrySink : public TelemetrySink
{
  public:
    explicit FileTelemetrySink(TelemetrySettings settings, std::shared_ptr<TelemetrySink> fallback = nullptr);
    ~FileTelemetrySink() override;

    FileTelemetrySink(const FileTelemetrySink &) = delete;
    FileTelemetrySink &operator=(const FileTelemetrySink &) = delete;

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

    const TelemetrySettings &settings() const { return m_settings; }
    [[nodiscard]] std::filesystem::path currentFile() const;
    [[nodiscard]] std::uint64_t recordsWritten() const;

  private:
    bool openSessionLocked();
    void closeSessionLocked();
    void pruneSessionsLocked();
    bool appendLocked(std::string_view eventName, const Payload &payload);
    void fallbackLocked(std::string_view eventName, const Payload &payload);

    TelemetrySettings m_settings;
    std::shared_ptr<TelemetrySink> m_fallback;

    mutable std::mutex m_mutex;
    std::ofstream m_stream;
    std::filesystem::path m_currentFile;
    std::uintmax_t m_sessionBytes = 0;
    std::uint64_t m_sessionIndex = 0;
    std::uint64_t m_sequence = 0;
};
