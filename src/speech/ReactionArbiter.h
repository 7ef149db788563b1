#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "speech/SpeechOutput.h"
#include "speech/SpeechRequest.h"

class TelemetrySink;

enum class SubmitResult : std::uint8_t
{
    Queued = 0,
    Replaced,
    Dropped,
    Rejected,
};

struct ArbiterOptions
{
    std::size_t queueCapacity = 16;
    std::chrono::milliseconds speechTimeout{20000};
    // One extra attempt for failures that were not timeouts.
    bool retryFailed = false;
};

struct ArbiterStats
{
    std::size_t submitted = 0;
    std::size_t replaced = 0;
    std::size_t dropped = 0;
    std::size_t spoken = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

// Serializes narration onto one output. submit() may be called from any thread and never
// waits for playback; one request at most is speaking, and it is never interrupted.
class ReactionArbiter
{
  public:
    ReactionArbiter(std::shared_ptr<SpeechOutput> output,
                    ArbiterOptions options = {},
                    std::shared_ptr<TelemetrySink> telemetry = nullptr);
    ~ReactionArbiter();

    ReactionArbiter(const ReactionArbiter &) = delete;
    ReactionArbiter &operator=(const ReactionArbiter &) = delete;

    SubmitResult submit(SpeechRequest request);

    // Moves the best queued request to speaking. Returns nothing while another request speaks.
    std::optional<SpeechRequest> next();
    // Delivers the request taken by next() and marks it done.
    void complete(const SpeechRequest &request);
    // next() followed by complete(); false when nothing was spoken.
    bool runOnce();

    void start();
    // Lets the current utterance finish, discards the queue and releases the output.
    void shutdown();

    bool waitUntilIdle(std::chrono::milliseconds timeout);

    std::size_t queuedCount() const;
    bool isIdle() const;
    std::optional<std::uint64_t> speakingId() const;
    ArbiterStats stats() const;

  private:
    struct Entry
    {
        SpeechRequest request;
        std::uint64_t sequence = 0;
    };

    std::optional<SpeechRequest> takeNextLocked();
    void dropOverflowLocked();
    SpeechOutcome deliver(const SpeechRequest &request, const std::string &text);
    std::string resolveText(const SpeechRequest &request);
    void workerLoop();

    std::shared_ptr<SpeechOutput> m_output;
    ArbiterOptions m_options;
    std::shared_ptr<TelemetrySink> m_telemetry;

    mutable std::mutex m_mutex;
    std::condition_variable m_wake;
    std::condition_variable m_idle;
    std::vector<Entry> m_queue;
    std::optional<std::uint64_t> m_speaking;
    std::uint64_t m_nextSequence = 1;
    std::uint64_t m_nextId = 1;
    bool m_stopping = false;
    bool m_released = false;
    ArbiterStats m_stats{};

    std::thread m_worker;
    std::atomic<bool> m_started{false};
};
