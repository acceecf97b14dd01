#pragma once

#include <QString>
#include <cstdint>
#include <vector>

namespace dr {

// One retrievable span of a source document. Written by ingestion,
// read-only inside the retrieval core.
struct Chunk {
    QString chunkId;
    int64_t documentId = 0;
    int chunkIndex = 0;
    QString content;
    std::vector<float> embedding;
    QString ownerId;
};

// Compute stable chunk ID: SHA-256 of "documentId#chunkIndex"
QString computeChunkId(int64_t documentId, int chunkIndex);

} // namespace dr
