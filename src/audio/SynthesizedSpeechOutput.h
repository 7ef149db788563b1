#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "audio/CommandSpeechSynthesizer.h"
#include "audio/SdlAudioPlayback.h"
#include "speech/SpeechOutput.h"

class TelemetrySink;

// Text-to-speech through an external program, played on the SDL device. One timeout
// covers both synthesis and playback.
class SynthesizedSpeechOutput : public SpeechOutput
{
  public:
    SynthesizedSpeechOutput(std::unique_ptr<CommandSpeechSynthesizer> synthesizer,
                            std::unique_ptr<SdlAudioPlayback> playback,
                            std::shared_ptr<TelemetrySink> telemetry = nullptr);

    SpeechOutcome speak(const std::string &text, std::chrono::milliseconds timeout) override;
    void release() override;

  private:
    std::unique_ptr<CommandSpeechSynthesizer> m_synthesizer;
    std::unique_ptr<SdlAudioPlayback> m_playback;
    std::shared_ptr<TelemetrySink> m_telemetry;
};
