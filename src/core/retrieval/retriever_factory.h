#pragma once

#include "core/index/sqlite_chunk_store.h"
#include "core/retrieval/hybrid_retriever.h"

#include <memory>
#include <optional>

namespace dr {

class EmbeddingProvider;
class WordSegmenter;
struct Settings;

// Everything one configured retriever needs. The retriever holds a
// reference to the store, so it is declared (and destroyed) after it.
struct RetrieverStack {
    std::unique_ptr<SQLiteChunkStore> store;
    std::shared_ptr<EmbeddingProvider> embeddingProvider;
    std::shared_ptr<WordSegmenter> segmenter;
    std::unique_ptr<HybridRetriever> retriever;
};

// Builds the production collaborators from Settings.
class RetrieverFactory {
public:
    // nullopt when the chunk store cannot be opened.
    static std::optional<RetrieverStack> create(const Settings& settings);

    static std::shared_ptr<EmbeddingProvider> createEmbeddingProvider(const Settings& settings);

    // nullptr when no segmenter program is configured; Thai text is then
    // tokenized unsegmented.
    static std::shared_ptr<WordSegmenter> createSegmenter(const Settings& settings);
};

} // namespace dr
