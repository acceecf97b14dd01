#pragma once

#include "core/embedding/embedding_provider.h"

#include <QByteArray>
#include <QStringList>

namespace dr {

// Runs an external command per query. The text is written to stdin; stdout
// must be a JSON array of numbers, or an object with an "embedding" array.
class ProcessEmbeddingProvider : public EmbeddingProvider {
public:
    static constexpr int kDefaultTimeoutMs = 10000;

    ProcessEmbeddingProvider(QString program, QStringList arguments,
                             int dimensions, int timeoutMs = kDefaultTimeoutMs);

    std::optional<std::vector<float>> embed(const QString& text) override;
    int dimensions() const override { return m_dimensions; }

    const QString& program() const { return m_program; }
    const QStringList& arguments() const { return m_arguments; }
    int timeoutMs() const { return m_timeoutMs; }

    // Exposed for tests
    static std::optional<std::vector<float>> parseEmbedding(const QByteArray& json);

private:
    QString m_program;
    QStringList m_arguments;
    int m_dimensions = 0;
    int m_timeoutMs = kDefaultTimeoutMs;
};

} // namespace dr
