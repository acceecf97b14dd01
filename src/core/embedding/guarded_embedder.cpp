#include "core/embedding/guarded_embedder.h"
#include "core/shared/logging.h"

#include <chrono>
#include <exception>
#include <utility>

namespace dr {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // anonymous namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // Half-open once the delay has passed: one attempt is let through
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

QString embedStatusToString(EmbedStatus status)
{
    switch (status) {
    case EmbedStatus::Ok:                return QStringLiteral("ok");
    case EmbedStatus::Failed:            return QStringLiteral("failed");
    case EmbedStatus::Timeout:           return QStringLiteral("timeout");
    case EmbedStatus::CircuitOpen:       return QStringLiteral("circuit_open");
    case EmbedStatus::DimensionMismatch: return QStringLiteral("dimension_mismatch");
    }
    return QStringLiteral("failed");
}

GuardedEmbedder::GuardedEmbedder(std::shared_ptr<EmbeddingProvider> provider, int timeoutMs)
    : m_provider(std::move(provider))
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs)
{
    if (m_provider) {
        m_worker = std::thread([this]() {
            workerLoop();
        });
    }
}

GuardedEmbedder::~GuardedEmbedder()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
        for (const auto& task : m_queue) {
            task->cancelled.store(true);
        }
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void GuardedEmbedder::workerLoop()
{
    for (;;) {
        std::shared_ptr<Task> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]() {
                return m_stop || !m_queue.empty();
            });
            if (m_queue.empty()) {
                return;
            }
            task = m_queue.front();
            m_queue.pop_front();
        }

        if (task->cancelled.load()) {
            task->promise.set_value(std::nullopt);
            continue;
        }

        try {
            task->promise.set_value(m_provider->embed(task->text));
        } catch (...) {
            task->promise.set_exception(std::current_exception());
        }
    }
}

int GuardedEmbedder::dimensions() const
{
    return m_provider ? m_provider->dimensions() : 0;
}

EmbedResult GuardedEmbedder::embed(const QString& text, int timeoutMs)
{
    EmbedResult result;
    if (!m_provider) {
        LOG_ERROR(drEmbedding, "No embedding provider configured");
        return result;
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(drEmbedding, "Embedding circuit breaker open (%d consecutive failures)",
                 m_circuitBreaker.consecutiveFailures.load());
        result.status = EmbedStatus::CircuitOpen;
        return result;
    }

    const int waitMs = (timeoutMs > 0 && timeoutMs < m_timeoutMs) ? timeoutMs : m_timeoutMs;

    auto task = std::make_shared<Task>();
    task->text = text;
    std::future<std::optional<std::vector<float>>> future = task->promise.get_future();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (static_cast<int>(m_queue.size()) >= kQueueLimit) {
            m_circuitBreaker.recordFailure();
            LOG_WARN(drEmbedding, "Embedding queue full (%d pending)", kQueueLimit);
            return result;
        }
        m_queue.push_back(task);
    }
    m_cv.notify_one();

    if (future.wait_for(std::chrono::milliseconds(waitMs)) != std::future_status::ready) {
        task->cancelled.store(true);
        m_circuitBreaker.recordFailure();
        LOG_WARN(drEmbedding, "Embedding timed out after %d ms", waitMs);
        result.status = EmbedStatus::Timeout;
        return result;
    }

    std::optional<std::vector<float>> embedding;
    try {
        embedding = future.get();
    } catch (const std::exception& e) {
        m_circuitBreaker.recordFailure();
        LOG_ERROR(drEmbedding, "Embedding provider threw: %s", e.what());
        return result;
    }
    if (!embedding || embedding->empty()) {
        m_circuitBreaker.recordFailure();
        LOG_WARN(drEmbedding, "Embedding provider returned no vector");
        result.status = EmbedStatus::Failed;
        return result;
    }

    const int expected = m_provider->dimensions();
    if (expected > 0 && static_cast<int>(embedding->size()) != expected) {
        m_circuitBreaker.recordFailure();
        LOG_ERROR(drEmbedding, "Embedding has %d dimensions, expected %d",
                  static_cast<int>(embedding->size()), expected);
        result.status = EmbedStatus::DimensionMismatch;
        return result;
    }

    m_circuitBreaker.recordSuccess();
    result.status = EmbedStatus::Ok;
    result.embedding = std::move(*embedding);
    return result;
}

} // namespace dr
