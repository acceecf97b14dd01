#include "core/retrieval/retriever_factory.h"
#include "core/embedding/process_embedding_provider.h"
#include "core/query/word_segmenter.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <utility>

namespace dr {

std::optional<RetrieverStack> RetrieverFactory::create(const Settings& settings)
{
    std::optional<SQLiteChunkStore> store = SQLiteChunkStore::open(settings.dbPath);
    if (!store) {
        LOG_ERROR(drCore, "Failed to open chunk store: %s", qUtf8Printable(settings.dbPath));
        return std::nullopt;
    }

    RetrieverStack stack;
    stack.store = std::make_unique<SQLiteChunkStore>(std::move(*store));
    stack.embeddingProvider = createEmbeddingProvider(settings);
    stack.segmenter = createSegmenter(settings);
    stack.retriever = std::make_unique<HybridRetriever>(*stack.store, stack.embeddingProvider,
                                                        stack.segmenter,
                                                        RetrieverConfig::fromSettings(settings));

    LOG_INFO(drCore, "Retriever ready: db=%s embedder=%s (%d dims) segmenter=%s",
             qUtf8Printable(settings.dbPath.isEmpty() ? QStringLiteral(":memory:")
                                                      : settings.dbPath),
             qUtf8Printable(settings.embeddingProgram), settings.embeddingDimensions,
             stack.segmenter ? qUtf8Printable(settings.segmenterProgram) : "disabled");
    return stack;
}

std::shared_ptr<EmbeddingProvider> RetrieverFactory::createEmbeddingProvider(const Settings& settings)
{
    if (settings.embeddingProgram.isEmpty()) {
        LOG_WARN(drEmbedding, "No embedding program configured; vector search will fail");
    }
    return std::make_shared<ProcessEmbeddingProvider>(
        settings.embeddingProgram, settings.embeddingArguments, settings.embeddingDimensions,
        static_cast<int>(settings.embeddingTimeoutMs));
}

std::shared_ptr<WordSegmenter> RetrieverFactory::createSegmenter(const Settings& settings)
{
    if (settings.segmenterProgram.isEmpty()) {
        return nullptr;
    }
    return std::make_shared<ProcessWordSegmenter>(
        settings.segmenterProgram, settings.segmenterArguments,
        static_cast<int>(settings.segmenterTimeoutMs));
}

} // namespace dr
