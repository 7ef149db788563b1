#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "speech/SpeechRequest.h"
#include "voice/AudioMixer.h"
#include "voice/Intent.h"

class TelemetrySink;

struct VoiceCommandOptions
{
    std::vector<std::string> wakeWords;
    // Relative commands move the level by this many percent.
    int volumeStep = 20;
    // Canonical target name to the word prefixes that select it.
    std::map<std::string, std::vector<std::string>> targets;
    // Target name to the form used in spoken feedback.
    std::map<std::string, std::string> spokenNames;

    static VoiceCommandOptions defaults();
};

struct VoiceOutcome
{
    bool wake = false;
    std::optional<Intent> intent;
    std::optional<SpeechRequest> feedback;
};

class VoiceCommandInterpreter
{
  public:
    explicit VoiceCommandInterpreter(VoiceCommandOptions options = VoiceCommandOptions::defaults(),
                                     std::shared_ptr<TelemetrySink> telemetry = nullptr);

    VoiceOutcome interpret(const std::string &utterance) const;

    // Spoken acknowledgement for a mixer intent once the mixer has answered.
    SpeechRequest mixerFeedback(const Intent &intent, const MixerResult &result) const;

    const VoiceCommandOptions &options() const { return m_options; }

  private:
    enum class Action
    {
        None,
        Decrease,
        Increase,
        Mute,
        Unmute,
    };

    Action classifyAction(const std::string &token) const;
    std::optional<std::string> classifyTarget(const std::string &token) const;
    std::string spokenName(const std::string &target) const;

    VoiceCommandOptions m_options;
    std::shared_ptr<TelemetrySink> m_telemetry;
};
