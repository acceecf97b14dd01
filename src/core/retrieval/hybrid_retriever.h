#pragma once

#include "core/embedding/guarded_embedder.h"
#include "core/query/query_parser.h"
#include "core/ranking/lexical_scorer.h"
#include "core/ranking/semantic_scorer.h"
#include "core/shared/search_options.h"
#include "core/shared/search_result.h"

#include <QString>
#include <memory>

namespace dr {

class ChunkStore;
class EmbeddingProvider;
class WordSegmenter;
struct Settings;

struct RetrieverConfig {
    int queryTimeoutMs = 30000;
    int embeddingTimeoutMs = GuardedEmbedder::kDefaultTimeoutMs;
    SearchParams defaultParams;
    int documentScopedMinChunks = SearchParams::kDefaultDocumentScopedMinChunks;
    LiteralBoostConfig literalBoosts;
    Bm25Params bm25;

    static RetrieverConfig fromSettings(const Settings& settings);
};

// HybridRetriever -- search(query, scope, params) over one owner's chunks.
//
// Per call: validate params, read the scope in one bulk fetch, parse the
// query, embed it, score lexically and semantically in parallel, then
// normalize, fuse and mass-select. Nothing but the embedding circuit
// breaker outlives a call. Any failure returns an empty result list; an
// exception from a collaborator becomes InternalError.
class HybridRetriever {
public:
    HybridRetriever(ChunkStore& store,
                    std::shared_ptr<EmbeddingProvider> embeddingProvider,
                    std::shared_ptr<WordSegmenter> segmenter = nullptr,
                    RetrieverConfig config = {});

    HybridRetriever(const HybridRetriever&) = delete;
    HybridRetriever& operator=(const HybridRetriever&) = delete;

    SearchOutcome search(const QString& query, const SearchScope& scope,
                         const SearchParams& params);

    // Uses defaultParams(scope).
    SearchOutcome search(const QString& query, const SearchScope& scope);

    // Configured defaults, with the document-scoped minChunks applied.
    SearchParams defaultParams(const SearchScope& scope) const;

    const RetrieverConfig& config() const { return m_config; }
    GuardedEmbedder& embedder() { return m_embedder; }

private:
    SearchOutcome runSearch(const QString& query, const SearchScope& scope,
                            const SearchParams& params);

    ChunkStore& m_store;
    GuardedEmbedder m_embedder;
    QueryParser m_parser;
    LexicalScorer m_lexicalScorer;
    SemanticScorer m_semanticScorer;
    RetrieverConfig m_config;
};

} // namespace dr
