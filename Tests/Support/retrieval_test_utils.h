#pragma once

#include "core/embedding/embedding_provider.h"
#include "core/index/chunk_store.h"
#include "core/query/word_segmenter.h"
#include "core/shared/chunk.h"

#include <QHash>
#include <QString>
#include <atomic>
#include <cstdint>
#include <vector>

namespace dr::test {

inline const QString kTestOwner = QStringLiteral("owner-1");

Chunk makeChunk(int64_t documentId, int chunkIndex, const QString& content,
                std::vector<float> embedding = {}, const QString& ownerId = kTestOwner);

// Unit vector along `axis` in `dimensions` dimensions.
std::vector<float> axisVector(int axis, int dimensions = 4);

// In-memory store honouring the owner and allow-list filters.
class FakeChunkStore : public ChunkStore {
public:
    std::optional<std::vector<Chunk>> listChunks(
        const QString& ownerId,
        const std::optional<std::vector<int64_t>>& documentIdAllowList) override;

    std::vector<Chunk> chunks;
    bool failReads = false;
    bool throwOnRead = false;
    int listCalls = 0;
};

// Returns a per-text vector when one is registered, else `defaultVector`.
class FakeEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(int dimensions = 4) : m_dimensions(dimensions) {}

    std::optional<std::vector<float>> embed(const QString& text) override;
    int dimensions() const override { return m_dimensions; }

    QHash<QString, std::vector<float>> vectors;
    std::vector<float> defaultVector;
    std::atomic<bool> fail{false};
    std::atomic<bool> throwOnEmbed{false};
    std::atomic<int> delayMs{0};
    std::atomic<int> calls{0};

private:
    int m_dimensions;
};

// Segments by lookup; unknown text or `fail` yields nullopt.
class FakeWordSegmenter : public WordSegmenter {
public:
    std::optional<QString> segment(const QString& text) override;

    QHash<QString, QString> segmentations;
    bool fail = false;
    int calls = 0;
};

} // namespace dr::test
