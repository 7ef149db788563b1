#include "speech/SpeechRequest.h"

const char *speechPriorityToString(SpeechPriority priority)
{
    switch (priority)
    {
    case SpeechPriority::Ambient:
        return "ambient";
    case SpeechPriority::ChatReply:
        return "chat_reply";
    case SpeechPriority::Combat:
        return "combat";
    case SpeechPriority::Highlight:
        return "highlight";
    case SpeechPriority::CommandFeedback:
        return "command_feedback";
    case SpeechPriority::Donation:
        return "donation";
    case SpeechPriority::Achievement:
        return "achievement";
    }
    return "unknown";
}

const char *speechStateToString(SpeechState state)
{
    switch (state)
    {
    case SpeechState::Queued:
        return "queued";
    case SpeechState::Speaking:
        return "speaking";
    case SpeechState::Done:
        return "done";
    case SpeechState::Cancelled:
        return "cancelled";
    case SpeechState::Dropped:
        return "dropped";
    }
    return "unknown";
}
