#include "audio/SynthesizedSpeechOutput.h"

#include <utility>

#include "telemetry/TelemetrySink.h"

SynthesizedSpeechOutput::SynthesizedSpeechOutput(std::unique_ptr<CommandSpeechSynthesizer> synthesizer,
                                                 std::unique_ptr<SdlAudioPlayback> playback,
                                                 std::shared_ptr<TelemetrySink> telemetry)
    : m_synthesizer(std::move(synthesizer)), m_playback(std::move(playback)), m_telemetry(std::move(telemetry))
{
}

SpeechOutcome SynthesizedSpeechOutput::speak(const std::string &text, std::chrono::milliseconds timeout)
{
    if (!m_synthesizer || !m_playback)
    {
        return SpeechOutcome::failure("speech output released");
    }
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;

    SynthesisResult synthesis = m_synthesizer->synthesize(text, deadline);
    if (!synthesis.success)
    {
        return SpeechOutcome::failure("synthesis: " + synthesis.error, synthesis.timedOut);
    }
    const auto synthesized = std::chrono::steady_clock::now();

    SpeechOutcome outcome = m_playback->playWav(synthesis.audio, deadline);
    if (outcome.success)
    {
        const auto finished = std::chrono::steady_clock::now();
        telemetry::emit(m_telemetry, "tts.spoken",
                        {{"bytes", std::to_string(synthesis.audio.size())},
                         {"synthesis_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(synthesized - started).count())},
                         {"playback_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(finished - synthesized).count())}});
    }
    return outcome;
}

void SynthesizedSpeechOutput::release()
{
    if (m_playback)
    {
        m_playback->close();
    }
    m_playback.reset();
    m_synthesizer.reset();
}
