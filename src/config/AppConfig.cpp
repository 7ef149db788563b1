#include "config/AppConfig.h"

const char *speechEngineToString(SpeechEngine engine)
{
    switch (engine)
    {
    case SpeechEngine::Console:
        return "console";
    case SpeechEngine::Command:
        return "command";
    }
    return "console";
}
