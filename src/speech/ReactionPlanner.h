#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "events/StreamEvent.h"
#include "speech/NarrationGenerator.h"
#include "speech/SpeechRequest.h"

class TelemetrySink;

// Minimum spacing between two spoken reactions of the same category. Categories without an
// entry are never suppressed.
struct NarrationCooldowns
{
    std::map<std::string, std::int64_t> millis;

    static NarrationCooldowns defaults();
};

// Turns events into speech requests. Called from the single event-consuming thread.
class ReactionPlanner
{
  public:
    ReactionPlanner(std::shared_ptr<TemplateNarrator> templates,
                    std::shared_ptr<NarrationGenerator> generator = nullptr,
                    NarrationCooldowns cooldowns = NarrationCooldowns::defaults(),
                    std::shared_ptr<TelemetrySink> telemetry = nullptr);

    std::optional<SpeechRequest> plan(const StreamEvent &event, std::int64_t nowMs);
    std::optional<SpeechRequest> planAmbient(std::int64_t nowMs);

    static SpeechRequest commandFeedback(std::string text, std::string dedupKey = {});

    const NarrationCooldowns &cooldowns() const { return m_cooldowns; }

  private:
    bool admit(const std::string &category, std::int64_t nowMs);
    SpeechRequest narrate(const std::string &category, SpeechPriority priority, const StreamEvent &event,
                          std::string dedupKey);

    std::shared_ptr<TemplateNarrator> m_templates;
    std::shared_ptr<NarrationGenerator> m_generator;
    NarrationCooldowns m_cooldowns;
    std::shared_ptr<TelemetrySink> m_telemetry;
    std::map<std::string, std::int64_t> m_lastSpoken;
};
