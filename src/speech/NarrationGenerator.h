#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "events/StreamEvent.h"

struct NarrationPrompt
{
    std::string category;
    StreamEvent event;
};

// Seam for the language-model response generator. Implementations may block and may fail;
// failure is reported as nullopt.
class NarrationGenerator
{
  public:
    virtual ~NarrationGenerator() = default;

    virtual std::optional<std::string> generate(const NarrationPrompt &prompt) = 0;
};

// Canned phrases per category. Always produces text.
class TemplateNarrator : public NarrationGenerator
{
  public:
    explicit TemplateNarrator(std::uint32_t seed = 0x1415u);

    std::optional<std::string> generate(const NarrationPrompt &prompt) override;
    std::string phrase(const NarrationPrompt &prompt);

    void setPhrases(const std::string &category, std::vector<std::string> phrases);

  private:
    const std::string &pick(const std::vector<std::string> &phrases);

    std::map<std::string, std::vector<std::string>> m_phrases;
    std::vector<std::string> m_defaultPhrases;
    std::mt19937 m_rng;
    std::mutex m_mutex;
};
