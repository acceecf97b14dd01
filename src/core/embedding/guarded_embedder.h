#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace dr {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

enum class EmbedStatus {
    Ok,
    Failed,
    Timeout,
    CircuitOpen,
    DimensionMismatch,
};

QString embedStatusToString(EmbedStatus status);

struct EmbedResult {
    EmbedStatus status = EmbedStatus::Failed;
    std::vector<float> embedding;

    bool ok() const { return status == EmbedStatus::Ok; }
};

// Wraps a provider with a per-call deadline, a dimensionality check and a
// circuit breaker. Provider calls run on one owned worker thread; a request
// that times out is cancelled if the worker has not picked it up yet, and
// the worker is joined on destruction.
class GuardedEmbedder {
public:
    static constexpr int kDefaultTimeoutMs = 10000;
    static constexpr int kQueueLimit = 4;

    explicit GuardedEmbedder(std::shared_ptr<EmbeddingProvider> provider,
                             int timeoutMs = kDefaultTimeoutMs);
    ~GuardedEmbedder();

    GuardedEmbedder(const GuardedEmbedder&) = delete;
    GuardedEmbedder& operator=(const GuardedEmbedder&) = delete;

    // timeoutMs <= 0 uses the configured timeout; otherwise the smaller of
    // the two applies.
    EmbedResult embed(const QString& text, int timeoutMs = 0);

    int dimensions() const;

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    struct Task {
        QString text;
        std::atomic<bool> cancelled{false};
        std::promise<std::optional<std::vector<float>>> promise;
    };

    void workerLoop();

    std::shared_ptr<EmbeddingProvider> m_provider;
    int m_timeoutMs = kDefaultTimeoutMs;
    EmbeddingCircuitBreaker m_circuitBreaker;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::shared_ptr<Task>> m_queue;
    bool m_stop = false;
    std::thread m_worker;
};

} // namespace dr
