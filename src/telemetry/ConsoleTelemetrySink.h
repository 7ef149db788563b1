#pragma once

#include <iosfwd>
#include <mutex>

#include "telemetry/TelemetrySink.h"

// Human-readable one-line records: "[12:04:31.250] event key=value ...", keys sorted.
class ConsoleTelemetrySink : public TelemetrySink
{
  public:
    ConsoleTelemetrySink();
    explicit ConsoleTelemetrySink(std::ostream &stream);

    void recordEvent(std::string_view eventName, const Payload &payload) override;
    void flush() override;

  private:
    std::mutex m_mutex;
    std::ostream &m_stream;
};
