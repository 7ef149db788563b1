#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class TelemetrySink;

struct SynthesisResult
{
    bool success = false;
    bool timedOut = false;
    std::string error;
    std::vector<std::uint8_t> audio;
};

// Runs an external text-to-speech program: the text is written to its stdin and a WAV
// document is read from its stdout. The process is killed when the deadline passes.
class CommandSpeechSynthesizer
{
  public:
    explicit CommandSpeechSynthesizer(std::vector<std::string> command,
                                      std::shared_ptr<TelemetrySink> telemetry = nullptr);

    SynthesisResult synthesize(const std::string &text, std::chrono::steady_clock::time_point deadline) const;

    const std::vector<std::string> &command() const { return m_command; }

  private:
    std::vector<std::string> m_command;
    std::shared_ptr<TelemetrySink> m_telemetry;
};
