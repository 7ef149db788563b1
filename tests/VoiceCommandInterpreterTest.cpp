#include "voice/VoiceCommandInterpreter.h"

#include "TestSupport.h"
#include "voice/TextNormalize.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

bool expectSetVolumeDelta(const VoiceOutcome &outcome, const std::string &target, int delta, const char *label)
{
    if (!outcome.wake || !outcome.intent || outcome.intent->kind != IntentKind::SetVolume ||
        outcome.intent->target != target || outcome.intent->delta != delta || outcome.intent->percent)
    {
        std::cerr << label << ": expected " << target << " delta " << delta << '\n';
        return false;
    }
    return true;
}

bool expectConverse(const VoiceOutcome &outcome, const std::string &text, const char *label)
{
    if (!outcome.wake || !outcome.intent || outcome.intent->kind != IntentKind::Converse || outcome.intent->text != text)
    {
        std::cerr << label << ": expected conversation \"" << text << "\"" << '\n';
        return false;
    }
    return true;
}

bool testTokenizeFoldsCaseAndPunctuation()
{
    const std::vector<std::string> tokens = text::tokenize("ИРИС, Ещё ГРОМЧЕ! 50%");
    const std::vector<std::string> expected = {"ирис", "еще", "громче", "50%"};
    if (tokens != expected)
    {
        std::cerr << "Tokenizer did not normalize the utterance" << '\n';
        return false;
    }
    return true;
}

bool testRelativeVolumeCommand()
{
    VoiceCommandInterpreter interpreter;
    if (!expectSetVolumeDelta(interpreter.interpret("Ирис, сделай музыку тише"), "music", -20, "quieter music"))
    {
        return false;
    }
    if (!expectSetVolumeDelta(interpreter.interpret("ирис дискорд погромче на 30%"), "discord", 30, "louder discord"))
    {
        return false;
    }
    return expectSetVolumeDelta(interpreter.interpret("Айрис, громче!"), SystemTarget, 20, "louder system");
}

bool testAbsoluteLevels()
{
    VoiceCommandInterpreter interpreter;
    const VoiceOutcome numeric = interpreter.interpret("Ирис поставь браузер на 40 процентов");
    if (!numeric.intent || numeric.intent->kind != IntentKind::SetVolume || numeric.intent->target != "browser" ||
        numeric.intent->percent != 40 || numeric.intent->delta)
    {
        std::cerr << "Absolute level was not recognized" << '\n';
        return false;
    }
    const VoiceOutcome named = interpreter.interpret("Ирис, игру на половину");
    if (!named.intent || named.intent->target != "game" || named.intent->percent != 50)
    {
        std::cerr << "Named level was not recognized" << '\n';
        return false;
    }
    return expectConverse(interpreter.interpret("Ирис музыку на 150"), "музыку на 150", "out of range level");
}

bool testMuteIsNotReadAsUnmute()
{
    VoiceCommandInterpreter interpreter;
    const VoiceOutcome mute = interpreter.interpret("Ирис, выключи дискорд");
    const VoiceOutcome unmute = interpreter.interpret("Ирис включи дискорд");
    if (!mute.intent || mute.intent->kind != IntentKind::Mute || mute.intent->target != "discord")
    {
        std::cerr << "Mute command misread" << '\n';
        return false;
    }
    if (!unmute.intent || unmute.intent->kind != IntentKind::Unmute || unmute.intent->target != "discord")
    {
        std::cerr << "Unmute command misread" << '\n';
        return false;
    }
    return true;
}

bool testWakeWordHandling()
{
    VoiceCommandInterpreter interpreter;
    if (!expectConverse(interpreter.interpret("Ирис"), "", "bare wake word"))
    {
        return false;
    }
    if (!expectConverse(interpreter.interpret("Ириска, как у тебя дела?"), "как у тебя дела", "small talk"))
    {
        return false;
    }
    const char *ignored[] = {"сделай музыку тише", "рис громче", "привет ирис", ""};
    for (const char *utterance : ignored)
    {
        const VoiceOutcome outcome = interpreter.interpret(utterance);
        if (outcome.wake || outcome.intent || outcome.feedback)
        {
            std::cerr << "Utterance without wake word was handled: " << utterance << '\n';
            return false;
        }
    }
    return true;
}

bool testConflictingCommandsBecomeConversation()
{
    VoiceCommandInterpreter interpreter;
    if (!expectConverse(interpreter.interpret("Ирис тише или громче"), "тише или громче", "two actions"))
    {
        return false;
    }
    return expectConverse(interpreter.interpret("Ирис музыку и дискорд тише"), "музыку и дискорд тише", "two targets");
}

bool testUnknownTargetGetsFeedback()
{
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    VoiceCommandInterpreter interpreter(VoiceCommandOptions::defaults(), telemetry);
    const VoiceOutcome outcome = interpreter.interpret("Ирис, сделай телеграм тише");
    if (!outcome.wake || outcome.intent || !outcome.feedback)
    {
        std::cerr << "Unknown target did not produce feedback" << '\n';
        return false;
    }
    if (outcome.feedback->text != "Не нашла приложение телеграм." ||
        outcome.feedback->priority != SpeechPriority::CommandFeedback)
    {
        std::cerr << "Unknown target feedback text mismatch" << '\n';
        return false;
    }
    if (telemetry->count("voice.target_not_found") != 1)
    {
        std::cerr << "Unknown target was not reported" << '\n';
        return false;
    }
    return true;
}

bool testStrayWordsKeepSystemTarget()
{
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    VoiceCommandInterpreter interpreter(VoiceCommandOptions::defaults(), telemetry);
    if (!expectSetVolumeDelta(interpreter.interpret("Ирис убавь плиз"), SystemTarget, -20, "courtesy word"))
    {
        return false;
    }
    if (!expectSetVolumeDelta(interpreter.interpret("Ирис ну убавь"), SystemTarget, -20, "word before the action"))
    {
        return false;
    }
    if (telemetry->count("voice.target_not_found") != 0)
    {
        std::cerr << "Stray word was reported as a missing application" << '\n';
        return false;
    }

    const VoiceOutcome missing = interpreter.interpret("Ирис выключи телеграм");
    if (missing.intent || !missing.feedback || missing.feedback->text != "Не нашла приложение телеграм.")
    {
        std::cerr << "Unknown word after the action was not treated as a target" << '\n';
        return false;
    }
    return telemetry->count("voice.target_not_found") == 1;
}

bool testMixerFeedback()
{
    VoiceCommandInterpreter interpreter;
    LoggingAudioMixer mixer;
    const VoiceOutcome outcome = interpreter.interpret("Ирис, сделай музыку тише");
    const MixerResult result = mixer.apply(*outcome.intent);
    if (!result.success || result.volume != 80 || mixer.volume("music") != 80)
    {
        std::cerr << "Mixer did not lower the music volume" << '\n';
        return false;
    }
    const SpeechRequest feedback = interpreter.mixerFeedback(*outcome.intent, result);
    if (feedback.text != "Громкость: музыку на 80%." || feedback.dedupKey != "voice:feedback")
    {
        std::cerr << "Mixer feedback text mismatch: " << feedback.text << '\n';
        return false;
    }

    MixerResult failed;
    failed.error = "device busy";
    Intent mute;
    mute.kind = IntentKind::Mute;
    mute.target = "discord";
    if (interpreter.mixerFeedback(mute, failed).text != "Не смогла выключить дискорд.")
    {
        std::cerr << "Mixer failure feedback text mismatch" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main()
{
    bool success = true;
    if (!testTokenizeFoldsCaseAndPunctuation())
    {
        success = false;
    }
    if (!testRelativeVolumeCommand())
    {
        success = false;
    }
    if (!testAbsoluteLevels())
    {
        success = false;
    }
    if (!testMuteIsNotReadAsUnmute())
    {
        success = false;
    }
    if (!testWakeWordHandling())
    {
        success = false;
    }
    if (!testConflictingCommandsBecomeConversation())
    {
        success = false;
    }
    if (!testUnknownTargetGetsFeedback())
    {
        success = false;
    }
    if (!testStrayWordsKeepSystemTarget())
    {
        success = false;
    }
    if (!testMixerFeedback())
    {
        success = false;
    }
    return success ? 0 : 1;
}
