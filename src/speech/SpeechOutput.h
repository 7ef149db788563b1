#pragma once

#include <chrono>
#include <iosfwd>
#include <mutex>
#include <string>
#include <utility>

struct SpeechOutcome
{
    bool success = false;
    bool timedOut = false;
    std::string error;

    static SpeechOutcome ok() { return {true, false, {}}; }
    static SpeechOutcome failure(std::string message, bool timedOut = false) { return {false, timedOut, std::move(message)}; }
};

// Synthesis plus playback of one utterance. speak() blocks until playback finishes,
// fails, or the timeout expires.
class SpeechOutput
{
  public:
    virtual ~SpeechOutput() = default;

    virtual SpeechOutcome speak(const std::string &text, std::chrono::milliseconds timeout) = 0;
    // Gives up the playback device. speak() is not called afterwards.
    virtual void release() {}
};

class ConsoleSpeechOutput : public SpeechOutput
{
  public:
    ConsoleSpeechOutput();
    explicit ConsoleSpeechOutput(std::ostream &stream);

    SpeechOutcome speak(const std::string &text, std::chrono::milliseconds timeout) override;

  private:
    std::ostream &m_stream;
    std::mutex m_mutex;
};
