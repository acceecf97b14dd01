#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace dr {

// Read side of durable chunk storage. One bulk read per query.
class ChunkStore {
public:
    virtual ~ChunkStore() = default;

    // All chunks owned by `ownerId`, optionally restricted to the listed
    // documents (an empty list means no restriction). nullopt means the
    // store could not be read; an empty vector is a valid, empty scope.
    virtual std::optional<std::vector<Chunk>> listChunks(
        const QString& ownerId,
        const std::optional<std::vector<int64_t>>& documentIdAllowList) = 0;
};

} // namespace dr
