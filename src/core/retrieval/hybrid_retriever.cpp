#include "core/retrieval/hybrid_retriever.h"
#include "core/embedding/embedding_provider.h"
#include "core/index/chunk_store.h"
#include "core/query/word_segmenter.h"
#include "core/ranking/search_merger.h"
#include "core/retrieval/snippet_extractor.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QElapsedTimer>

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace dr {

RetrieverConfig RetrieverConfig::fromSettings(const Settings& settings)
{
    RetrieverConfig config;
    config.queryTimeoutMs = static_cast<int>(settings.queryTimeoutMs);
    config.embeddingTimeoutMs = static_cast<int>(settings.embeddingTimeoutMs);
    config.defaultParams.keywordWeight = settings.keywordWeight;
    config.defaultParams.vectorWeight = settings.vectorWeight;
    config.defaultParams.massFraction = settings.massFraction;
    config.defaultParams.minChunks = settings.minChunks;
    config.defaultParams.maxChunks = settings.maxChunks;
    config.documentScopedMinChunks = settings.documentScopedMinChunks;
    config.literalBoosts.primaryTerms = settings.primaryBoostTerms;
    config.literalBoosts.secondaryTerms = settings.secondaryBoostTerms;
    config.literalBoosts.primaryBoost = settings.primaryBoost;
    config.literalBoosts.secondaryBoost = settings.secondaryBoost;
    return config;
}

HybridRetriever::HybridRetriever(ChunkStore& store,
                                 std::shared_ptr<EmbeddingProvider> embeddingProvider,
                                 std::shared_ptr<WordSegmenter> segmenter,
                                 RetrieverConfig config)
    : m_store(store)
    , m_embedder(std::move(embeddingProvider), config.embeddingTimeoutMs)
    , m_parser(std::move(segmenter))
    , m_lexicalScorer(config.bm25)
    , m_semanticScorer(config.literalBoosts)
    , m_config(std::move(config))
{
}

SearchParams HybridRetriever::defaultParams(const SearchScope& scope) const
{
    return SearchParams::defaultsFor(scope, m_config.defaultParams,
                                     m_config.documentScopedMinChunks);
}

SearchOutcome HybridRetriever::search(const QString& query, const SearchScope& scope)
{
    return search(query, scope, defaultParams(scope));
}

SearchOutcome HybridRetriever::search(const QString& query, const SearchScope& scope,
                                      const SearchParams& params)
{
    try {
        return runSearch(query, scope, params);
    } catch (const std::exception& e) {
        LOG_ERROR(drCore, "Search failed: %s", e.what());
        return SearchOutcome::failure(SearchStatus::InternalError,
                                      QStringLiteral("search failed: %1")
                                          .arg(QString::fromUtf8(e.what())));
    }
}

SearchOutcome HybridRetriever::runSearch(const QString& query, const SearchScope& scope,
                                         const SearchParams& params)
{
    QElapsedTimer timer;
    timer.start();
    const int budgetMs = m_config.queryTimeoutMs;
    const auto expired = [&]() {
        return budgetMs > 0 && timer.elapsed() >= budgetMs;
    };
    const auto timedOut = [&](const char* stage) {
        LOG_WARN(drCore, "Search timed out during %s after %lld ms (budget %d ms)",
                 stage, static_cast<long long>(timer.elapsed()), budgetMs);
        return SearchOutcome::failure(SearchStatus::Timeout,
                                      QStringLiteral("query timed out during %1")
                                          .arg(QLatin1String(stage)));
    };

    if (const auto invalid = params.validate()) {
        LOG_WARN(drCore, "Rejected search params: %s", qUtf8Printable(*invalid));
        return SearchOutcome::failure(SearchStatus::InvalidParams, *invalid);
    }

    LOG_INFO(drCore, "Search: owner=%s scoped=%d kw=%.2f vec=%.2f mass=%.2f min=%d max=%d",
             qUtf8Printable(scope.ownerId), scope.isDocumentScoped() ? 1 : 0,
             params.keywordWeight, params.vectorWeight, params.massFraction,
             params.minChunks, params.maxChunks);

    // 1. One bulk read of the scope
    const std::optional<std::vector<Chunk>> loaded =
        m_store.listChunks(scope.ownerId, scope.documentIdAllowList);
    if (!loaded) {
        LOG_ERROR(drCore, "Chunk store unavailable for owner %s", qUtf8Printable(scope.ownerId));
        return SearchOutcome::failure(SearchStatus::UpstreamUnavailable,
                                      QStringLiteral("chunk store unavailable"));
    }
    if (expired()) {
        return timedOut("chunk load");
    }
    const std::vector<Chunk>& candidates = *loaded;
    if (candidates.empty()) {
        LOG_INFO(drCore, "Search: no chunks in scope");
        return SearchOutcome{};
    }

    // 2. Query terms (segmenter failure degrades inside the parser)
    const ParsedQuery parsed = m_parser.parse(query);
    if (expired()) {
        return timedOut("query parsing");
    }
    if (parsed.tokens.isEmpty()) {
        LOG_INFO(drCore, "Search: query has no searchable tokens");
        return SearchOutcome{};
    }

    // 3. Query embedding, bounded by whatever remains of the budget
    std::vector<float> queryEmbedding;
    if (params.vectorWeight > 0.0) {
        int remainingMs = 0;
        if (budgetMs > 0) {
            remainingMs = std::max(1, budgetMs - static_cast<int>(timer.elapsed()));
        }
        EmbedResult embedded = m_embedder.embed(query, remainingMs);
        if (!embedded.ok()) {
            const bool budgetBound = remainingMs > 0 && remainingMs < m_config.embeddingTimeoutMs;
            if (expired() || (embedded.status == EmbedStatus::Timeout && budgetBound)) {
                return timedOut("embedding");
            }
            return SearchOutcome::failure(
                SearchStatus::UpstreamUnavailable,
                QStringLiteral("embedding provider: %1").arg(embedStatusToString(embedded.status)));
        }
        queryEmbedding = std::move(embedded.embedding);
    }

    // 4. Independent scorers over the same candidates. The future joins the
    // lexical thread even when semantic scoring throws; get() rethrows.
    std::future<LexicalScores> lexicalFuture = std::async(std::launch::async, [&]() {
        return m_lexicalScorer.score(parsed.terms, candidates);
    });
    SemanticScores semanticScores;
    if (!queryEmbedding.empty()) {
        semanticScores = m_semanticScorer.score(queryEmbedding, candidates, query);
    }
    const LexicalScores lexicalScores = lexicalFuture.get();
    if (expired()) {
        return timedOut("scoring");
    }

    // 5. Normalize, fuse, mass-select
    SearchOutcome outcome;
    outcome.results = SearchMerger::merge(candidates, lexicalScores, semanticScores, params);
    for (RankedResult& result : outcome.results) {
        result.snippets = SnippetExtractor::extract(result.content, result.matchedTerms);
    }
    if (expired()) {
        return timedOut("fusion");
    }

    LOG_INFO(drCore, "Search: %d candidates, %d lexical, %d semantic -> %d results in %lld ms",
             static_cast<int>(candidates.size()), static_cast<int>(lexicalScores.size()),
             static_cast<int>(semanticScores.size()), static_cast<int>(outcome.results.size()),
             static_cast<long long>(timer.elapsed()));
    return outcome;
}

} // namespace dr
