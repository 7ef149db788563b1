#include "speech/SpeechOutput.h"

#include <iostream>

ConsoleSpeechOutput::ConsoleSpeechOutput() : m_stream(std::cout) {}

ConsoleSpeechOutput::ConsoleSpeechOutput(std::ostream &stream) : m_stream(stream) {}

SpeechOutcome ConsoleSpeechOutput::speak(const std::string &text, std::chrono::milliseconds)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stream << "[Ирис] " << text << std::endl;
    if (!m_stream)
    {
        return SpeechOutcome::failure("console stream is not writable");
    }
    return SpeechOutcome::ok();
}
