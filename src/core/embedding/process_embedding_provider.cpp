#include "core/embedding/process_embedding_provider.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QProcess>

#include <algorithm>
#include <cmath>
#include <utility>

namespace dr {

ProcessEmbeddingProvider::ProcessEmbeddingProvider(QString program, QStringList arguments,
                                                   int dimensions, int timeoutMs)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_dimensions(dimensions)
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs)
{
}

std::optional<std::vector<float>> ProcessEmbeddingProvider::embed(const QString& text)
{
    if (m_program.isEmpty()) {
        LOG_WARN(drEmbedding, "No embedding program configured");
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.start(m_program, m_arguments);
    if (!process.waitForStarted(m_timeoutMs)) {
        LOG_WARN(drEmbedding, "Embedding program failed to start: %s",
                 qUtf8Printable(m_program));
        return std::nullopt;
    }

    process.write(text.toUtf8());
    process.closeWriteChannel();

    const int remainingMs = std::max(1, m_timeoutMs - static_cast<int>(timer.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        process.kill();
        process.waitForFinished();
        LOG_WARN(drEmbedding, "Embedding program timed out after %d ms", m_timeoutMs);
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        LOG_WARN(drEmbedding, "Embedding program exited with code %d: %s",
                 process.exitCode(), qUtf8Printable(stderrText.left(300)));
        return std::nullopt;
    }

    auto embedding = parseEmbedding(process.readAllStandardOutput());
    if (!embedding) {
        return std::nullopt;
    }

    LOG_DEBUG(drEmbedding, "Embedded %d chars into %d dims in %lld ms",
              static_cast<int>(text.size()), static_cast<int>(embedding->size()),
              static_cast<long long>(timer.elapsed()));
    return embedding;
}

std::optional<std::vector<float>> ProcessEmbeddingProvider::parseEmbedding(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json.trimmed(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(drEmbedding, "Malformed embedding output: %s",
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    QJsonArray values;
    if (doc.isArray()) {
        values = doc.array();
    } else if (doc.isObject()) {
        values = doc.object().value(QStringLiteral("embedding")).toArray();
    }
    if (values.isEmpty()) {
        LOG_WARN(drEmbedding, "Embedding output contains no vector");
        return std::nullopt;
    }

    std::vector<float> embedding;
    embedding.reserve(static_cast<size_t>(values.size()));
    for (const QJsonValue& value : values) {
        if (!value.isDouble() || !std::isfinite(value.toDouble())) {
            LOG_WARN(drEmbedding, "Embedding output contains a non-numeric component");
            return std::nullopt;
        }
        embedding.push_back(static_cast<float>(value.toDouble()));
    }
    return embedding;
}

} // namespace dr
