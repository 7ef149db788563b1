#include "speech/ReactionArbiter.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "telemetry/TelemetrySink.h"

namespace
{

std::int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

TelemetrySink::Payload describe(const SpeechRequest &request)
{
    return {{"id", std::to_string(request.id)},
            {"priority", speechPriorityToString(request.priority)},
            {"category", request.category},
            {"dedup_key", request.dedupKey}};
}

} // namespace

ReactionArbiter::ReactionArbiter(std::shared_ptr<SpeechOutput> output,
                                 ArbiterOptions options,
                                 std::shared_ptr<TelemetrySink> telemetry)
    : m_output(std::move(output)), m_options(options), m_telemetry(std::move(telemetry))
{
    m_options.queueCapacity = std::max<std::size_t>(1, m_options.queueCapacity);
}

ReactionArbiter::~ReactionArbiter()
{
    shutdown();
}

SubmitResult ReactionArbiter::submit(SpeechRequest request)
{
    TelemetrySink::Payload droppedPayload;
    SubmitResult result = SubmitResult::Queued;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping)
        {
            return SubmitResult::Rejected;
        }
        if (request.id == 0)
        {
            request.id = m_nextId++;
        }
        if (request.createdMs == 0)
        {
            request.createdMs = steadyNowMs();
        }
        ++m_stats.submitted;

        auto existing = m_queue.end();
        if (!request.dedupKey.empty())
        {
            existing = std::find_if(m_queue.begin(), m_queue.end(), [&request](const Entry &entry) {
                return entry.request.dedupKey == request.dedupKey;
            });
        }

        if (existing != m_queue.end())
        {
            // The replacement keeps the queue position of the request it collapses.
            request.priority = std::max(request.priority, existing->request.priority);
            existing->request = std::move(request);
            ++m_stats.replaced;
            result = SubmitResult::Replaced;
        }
        else
        {
            const std::uint64_t sequence = m_nextSequence++;
            const std::uint64_t id = request.id;
            m_queue.push_back(Entry{std::move(request), sequence});
            if (m_queue.size() > m_options.queueCapacity)
            {
                auto victim = m_queue.begin();
                for (auto it = m_queue.begin(); it != m_queue.end(); ++it)
                {
                    if (it->request.priority < victim->request.priority ||
                        (it->request.priority == victim->request.priority && it->sequence > victim->sequence))
                    {
                        victim = it;
                    }
                }
                droppedPayload = describe(victim->request);
                if (victim->request.id == id)
                {
                    result = SubmitResult::Dropped;
                }
                m_queue.erase(victim);
                ++m_stats.dropped;
            }
        }
    }

    if (!droppedPayload.empty())
    {
        telemetry::emit(m_telemetry, "arbiter.dropped", droppedPayload);
    }
    m_wake.notify_one();
    return result;
}

std::optional<SpeechRequest> ReactionArbiter::takeNextLocked()
{
    if (m_speaking || m_queue.empty() || m_stopping)
    {
        return std::nullopt;
    }
    auto best = m_queue.begin();
    for (auto it = m_queue.begin(); it != m_queue.end(); ++it)
    {
        if (it->request.priority > best->request.priority ||
            (it->request.priority == best->request.priority && it->sequence < best->sequence))
        {
            best = it;
        }
    }
    SpeechRequest request = std::move(best->request);
    m_queue.erase(best);
    m_speaking = request.id;
    return request;
}

std::optional<SpeechRequest> ReactionArbiter::next()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return takeNextLocked();
}

std::string ReactionArbiter::resolveText(const SpeechRequest &request)
{
    if (!request.producer)
    {
        return request.text.empty() ? request.fallbackText : request.text;
    }
    try
    {
        if (auto produced = request.producer(); produced && !produced->empty())
        {
            return *produced;
        }
    }
    catch (const std::exception &ex)
    {
        auto payload = describe(request);
        payload["message"] = ex.what();
        telemetry::emit(m_telemetry, "arbiter.producer_failed", payload);
    }
    catch (...)
    {
        auto payload = describe(request);
        payload["message"] = "unknown";
        telemetry::emit(m_telemetry, "arbiter.producer_failed", payload);
    }
    return request.fallbackText.empty() ? request.text : request.fallbackText;
}

SpeechOutcome ReactionArbiter::deliver(const SpeechRequest &request, const std::string &text)
{
    if (!m_output)
    {
        return SpeechOutcome::failure("no speech output");
    }
    try
    {
        return m_output->speak(text, m_options.speechTimeout);
    }
    catch (const std::exception &ex)
    {
        return SpeechOutcome::failure(ex.what());
    }
    catch (...)
    {
        auto payload = describe(request);
        payload["message"] = "unknown";
        telemetry::emit(m_telemetry, "arbiter.output_exception", payload);
        return SpeechOutcome::failure("unknown exception");
    }
}

void ReactionArbiter::complete(const SpeechRequest &request)
{
    const std::string text = resolveText(request);
    bool spoken = false;
    if (text.empty())
    {
        telemetry::emit(m_telemetry, "arbiter.empty_text", describe(request));
    }
    else
    {
        SpeechOutcome outcome = deliver(request, text);
        if (!outcome.success && !outcome.timedOut && m_options.retryFailed)
        {
            auto payload = describe(request);
            payload["error"] = outcome.error;
            telemetry::emit(m_telemetry, "arbiter.retry", payload);
            outcome = deliver(request, text);
        }
        if (outcome.success)
        {
            spoken = true;
            telemetry::emit(m_telemetry, "arbiter.spoken", describe(request));
        }
        else
        {
            auto payload = describe(request);
            payload["error"] = outcome.error;
            payload["timed_out"] = outcome.timedOut ? "true" : "false";
            telemetry::emit(m_telemetry, "arbiter.speech_failed", payload);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_speaking && *m_speaking == request.id)
        {
            m_speaking.reset();
        }
        if (spoken)
        {
            ++m_stats.spoken;
        }
        else
        {
            ++m_stats.failed;
        }
    }
    m_idle.notify_all();
    m_wake.notify_one();
}

bool ReactionArbiter::runOnce()
{
    auto request = next();
    if (!request)
    {
        return false;
    }
    complete(*request);
    return true;
}

void ReactionArbiter::start()
{
    bool expected = false;
    if (!m_started.compare_exchange_strong(expected, true))
    {
        return;
    }
    m_worker = std::thread([this]() { workerLoop(); });
}

void ReactionArbiter::workerLoop()
{
    for (;;)
    {
        std::optional<SpeechRequest> request;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait(lock, [this]() { return m_stopping || (!m_speaking && !m_queue.empty()); });
            if (m_stopping)
            {
                return;
            }
            request = takeNextLocked();
        }
        if (request)
        {
            complete(*request);
        }
    }
}

void ReactionArbiter::shutdown()
{
    std::size_t discarded = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_released)
        {
            return;
        }
        m_stopping = true;
        discarded = m_queue.size();
        m_stats.cancelled += discarded;
        m_queue.clear();
    }
    m_wake.notify_all();
    if (m_worker.joinable())
    {
        m_worker.join();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_released = true;
    }
    if (m_output)
    {
        m_output->release();
    }
    m_idle.notify_all();
    telemetry::emit(m_telemetry, "arbiter.shutdown", {{"discarded", std::to_string(discarded)}});
}

bool ReactionArbiter::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idle.wait_for(lock, timeout, [this]() { return m_queue.empty() && !m_speaking; });
}

std::size_t ReactionArbiter::queuedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

bool ReactionArbiter::isIdle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.empty() && !m_speaking;
}

std::optional<std::uint64_t> ReactionArbiter::speakingId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_speaking;
}

ArbiterStats ReactionArbiter::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}
