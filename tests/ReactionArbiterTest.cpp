#include "speech/ReactionArbiter.h"

#include "TestSupport.h"

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

SpeechRequest makeRequest(SpeechPriority priority, std::string text, std::string dedupKey = {})
{
    SpeechRequest request;
    request.priority = priority;
    request.category = speechPriorityToString(priority);
    request.text = std::move(text);
    request.dedupKey = std::move(dedupKey);
    return request;
}

bool expectSpoken(const RecordingSpeechOutput &output, const std::vector<std::string> &expected, const char *label)
{
    if (output.spokenTexts() == expected)
    {
        return true;
    }
    std::cerr << label << ": spoken [";
    for (const std::string &text : output.spokenTexts())
    {
        std::cerr << ' ' << text;
    }
    std::cerr << " ]" << '\n';
    return false;
}

// Holds every utterance until open(), so requests can arrive while one is playing.
class GatedSpeechOutput : public SpeechOutput
{
  public:
    SpeechOutcome speak(const std::string &text, std::chrono::milliseconds) override
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        ++m_started;
        m_changed.notify_all();
        m_changed.wait(lock, [this]() { return m_open; });
        m_spoken.push_back(text);
        return SpeechOutcome::ok();
    }

    bool waitForStart(int count, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_changed.wait_for(lock, timeout, [this, count]() { return m_started >= count; });
    }

    void open()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_open = true;
        }
        m_changed.notify_all();
    }

    std::vector<std::string> spokenTexts() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_spoken;
    }

  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    bool m_open = false;
    int m_started = 0;
    std::vector<std::string> m_spoken;
};

bool testHigherPrioritySpeaksFirst()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    ReactionArbiter arbiter(output);
    arbiter.submit(makeRequest(SpeechPriority::Combat, "kill"));
    arbiter.submit(makeRequest(SpeechPriority::Ambient, "idle"));
    arbiter.submit(makeRequest(SpeechPriority::Donation, "donation"));
    arbiter.submit(makeRequest(SpeechPriority::Combat, "bomb"));
    while (arbiter.runOnce())
    {
    }
    return expectSpoken(*output, {"donation", "kill", "bomb", "idle"}, "priority order");
}

bool testDedupReplacesQueuedRequest()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    ReactionArbiter arbiter(output);
    arbiter.submit(makeRequest(SpeechPriority::ChatReply, "chat"));
    arbiter.submit(makeRequest(SpeechPriority::Combat, "first kill", "combat:de_dust2:r3"));
    const SubmitResult result = arbiter.submit(makeRequest(SpeechPriority::Highlight, "ace", "combat:de_dust2:r3"));
    if (result != SubmitResult::Replaced || arbiter.queuedCount() != 2)
    {
        std::cerr << "Request with the same dedup key was not collapsed" << '\n';
        return false;
    }
    while (arbiter.runOnce())
    {
    }
    return expectSpoken(*output, {"ace", "chat"}, "dedup");
}

bool testOverflowDropsLowestPriority()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    ArbiterOptions options;
    options.queueCapacity = 2;
    ReactionArbiter arbiter(output, options, telemetry);

    arbiter.submit(makeRequest(SpeechPriority::Combat, "speaking"));
    const auto speaking = arbiter.next();
    if (!speaking || arbiter.next())
    {
        std::cerr << "Second request started while one was speaking" << '\n';
        return false;
    }

    arbiter.submit(makeRequest(SpeechPriority::ChatReply, "chat"));
    arbiter.submit(makeRequest(SpeechPriority::Combat, "kill"));
    if (arbiter.submit(makeRequest(SpeechPriority::Ambient, "idle")) != SubmitResult::Dropped)
    {
        std::cerr << "Lowest priority newcomer was not dropped" << '\n';
        return false;
    }
    if (arbiter.submit(makeRequest(SpeechPriority::Donation, "donation")) != SubmitResult::Queued)
    {
        std::cerr << "Higher priority newcomer was not queued" << '\n';
        return false;
    }
    if (arbiter.queuedCount() != 2 || arbiter.stats().dropped != 2 || telemetry->count("arbiter.dropped") != 2)
    {
        std::cerr << "Queue exceeded its capacity or drops were not reported" << '\n';
        return false;
    }
    if (arbiter.speakingId() != speaking->id)
    {
        std::cerr << "Overflow interrupted the speaking request" << '\n';
        return false;
    }

    arbiter.complete(*speaking);
    while (arbiter.runOnce())
    {
    }
    return expectSpoken(*output, {"speaking", "donation", "kill"}, "overflow");
}

bool testFailedSpeechMovesOn()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    output->failTexts.insert("broken");
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    ReactionArbiter arbiter(output, ArbiterOptions{}, telemetry);

    arbiter.submit(makeRequest(SpeechPriority::Donation, "broken"));
    arbiter.submit(makeRequest(SpeechPriority::Combat, "fine"));
    while (arbiter.runOnce())
    {
    }
    const ArbiterStats stats = arbiter.stats();
    if (stats.failed != 1 || stats.spoken != 1 || output->attempts != 2)
    {
        std::cerr << "Failed request was retried or blocked the queue" << '\n';
        return false;
    }
    if (telemetry->count("arbiter.speech_failed") != 1 || !arbiter.isIdle())
    {
        std::cerr << "Speech failure was not reported" << '\n';
        return false;
    }
    return expectSpoken(*output, {"fine"}, "failure");
}

bool testRetryOnceWhenEnabled()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    output->failTexts.insert("broken");
    ArbiterOptions options;
    options.retryFailed = true;
    ReactionArbiter arbiter(output, options);
    arbiter.submit(makeRequest(SpeechPriority::Combat, "broken"));
    arbiter.runOnce();
    if (output->attempts != 2 || arbiter.stats().failed != 1)
    {
        std::cerr << "Failed request was not retried exactly once" << '\n';
        return false;
    }
    return true;
}

bool testProducerFailureUsesFallback()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    auto telemetry = std::make_shared<RecordingTelemetrySink>();
    ReactionArbiter arbiter(output, ArbiterOptions{}, telemetry);

    SpeechRequest throwing = makeRequest(SpeechPriority::Combat, "");
    throwing.producer = []() -> std::optional<std::string> { throw std::runtime_error("model offline"); };
    throwing.fallbackText = "Отличный выстрел!";
    SpeechRequest generated = makeRequest(SpeechPriority::Combat, "");
    generated.producer = []() -> std::optional<std::string> { return std::string("Сгенерировано"); };
    generated.fallbackText = "запасной";
    SpeechRequest empty = makeRequest(SpeechPriority::Combat, "");
    empty.producer = []() -> std::optional<std::string> { return std::nullopt; };
    empty.fallbackText = "Шаблон";

    arbiter.submit(throwing);
    arbiter.submit(generated);
    arbiter.submit(empty);
    while (arbiter.runOnce())
    {
    }
    if (telemetry->count("arbiter.producer_failed") != 1)
    {
        std::cerr << "Producer exception was not reported" << '\n';
        return false;
    }
    return expectSpoken(*output, {"Отличный выстрел!", "Сгенерировано", "Шаблон"}, "producer");
}

bool testShutdownDiscardsQueue()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    ReactionArbiter arbiter(output);
    arbiter.submit(makeRequest(SpeechPriority::Combat, "one"));
    arbiter.submit(makeRequest(SpeechPriority::Combat, "two"));
    arbiter.shutdown();
    if (arbiter.stats().cancelled != 2 || arbiter.queuedCount() != 0 || !output->released)
    {
        std::cerr << "Shutdown did not discard the queue and release the output" << '\n';
        return false;
    }
    if (arbiter.submit(makeRequest(SpeechPriority::Achievement, "late")) != SubmitResult::Rejected)
    {
        std::cerr << "Request accepted after shutdown" << '\n';
        return false;
    }
    return output->spokenTexts().empty();
}

bool testWorkerDrainsInSubmissionOrder()
{
    auto output = std::make_shared<RecordingSpeechOutput>();
    ReactionArbiter arbiter(output);
    arbiter.start();
    arbiter.submit(makeRequest(SpeechPriority::ChatReply, "a"));
    arbiter.submit(makeRequest(SpeechPriority::ChatReply, "b"));
    arbiter.submit(makeRequest(SpeechPriority::ChatReply, "c"));
    if (!arbiter.waitUntilIdle(std::chrono::milliseconds(2000)))
    {
        std::cerr << "Worker did not drain the queue" << '\n';
        return false;
    }
    arbiter.shutdown();
    return expectSpoken(*output, {"a", "b", "c"}, "worker");
}

bool testSubmitWhileSpeakingKeepsPriorityOrder()
{
    auto output = std::make_shared<GatedSpeechOutput>();
    ReactionArbiter arbiter(output);
    arbiter.start();
    arbiter.submit(makeRequest(SpeechPriority::Combat, "kill"));

    bool success = true;
    if (!output->waitForStart(1, std::chrono::milliseconds(2000)))
    {
        std::cerr << "Worker never started speaking" << '\n';
        success = false;
    }
    else
    {
        const auto began = std::chrono::steady_clock::now();
        const SubmitResult donation = arbiter.submit(makeRequest(SpeechPriority::Donation, "donation"));
        const SubmitResult ambient = arbiter.submit(makeRequest(SpeechPriority::Ambient, "ambient"));
        const auto elapsed = std::chrono::steady_clock::now() - began;
        if (donation != SubmitResult::Queued || ambient != SubmitResult::Queued)
        {
            std::cerr << "Requests submitted during speech were not queued" << '\n';
            success = false;
        }
        if (elapsed > std::chrono::milliseconds(200))
        {
            std::cerr << "submit() waited for the current utterance" << '\n';
            success = false;
        }
        if (arbiter.queuedCount() != 2 || !arbiter.speakingId())
        {
            std::cerr << "Expected one speaking and two queued requests" << '\n';
            success = false;
        }
    }

    output->open();
    if (!arbiter.waitUntilIdle(std::chrono::milliseconds(2000)))
    {
        std::cerr << "Worker did not drain after the gate opened" << '\n';
        success = false;
    }
    arbiter.shutdown();

    const std::vector<std::string> expected{"kill", "donation", "ambient"};
    if (output->spokenTexts() != expected)
    {
        std::cerr << "Utterances spoken out of priority order" << '\n';
        success = false;
    }
    return success;
}

} // namespace

int main()
{
    bool success = true;
    if (!testHigherPrioritySpeaksFirst())
    {
        success = false;
    }
    if (!testDedupReplacesQueuedRequest())
    {
        success = false;
    }
    if (!testOverflowDropsLowestPriority())
    {
        success = false;
    }
    if (!testFailedSpeechMovesOn())
    {
        success = false;
    }
    if (!testRetryOnceWhenEnabled())
    {
        success = false;
    }
    if (!testProducerFailureUsesFallback())
    {
        success = false;
    }
    if (!testShutdownDiscardsQueue())
    {
        success = false;
    }
    if (!testWorkerDrainsInSubmissionOrder())
    {
        success = false;
    }
    if (!testSubmitWhileSpeakingKeepsPriorityOrder())
    {
        success = false;
    }
    return success ? 0 : 1;
}
