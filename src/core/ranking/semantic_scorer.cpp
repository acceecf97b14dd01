#include "core/ranking/semantic_scorer.h"
#include "core/shared/logging.h"
#include "core/text/thai_text.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dr {

SemanticScorer::SemanticScorer(LiteralBoostConfig boosts)
    : m_boosts(std::move(boosts))
{
}

std::optional<double> SemanticScorer::cosineSimilarity(const std::vector<float>& a,
                                                       const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return std::nullopt;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double x = static_cast<double>(a[i]);
        const double y = static_cast<double>(b[i]);
        dot += x * y;
        normA += x * x;
        normB += y * y;
    }

    if (normA <= 0.0 || normB <= 0.0 || !std::isfinite(dot)) {
        return std::nullopt;
    }
    const double cosine = dot / (std::sqrt(normA) * std::sqrt(normB));
    return std::clamp(cosine, -1.0, 1.0);
}

std::vector<SemanticScorer::ActiveLiteral> SemanticScorer::activeLiterals(
    const QString& queryText) const
{
    std::vector<ActiveLiteral> active;
    if (m_boosts.isEmpty() || queryText.isEmpty()) {
        return active;
    }

    const QString foldedQuery = thai::foldCompact(queryText);
    const auto collect = [&](const QStringList& terms, double boost) {
        for (const QString& term : terms) {
            const QString folded = thai::foldCompact(term);
            if (!folded.isEmpty() && foldedQuery.contains(folded)) {
                active.push_back(ActiveLiteral{folded, boost});
            }
        }
    };
    collect(m_boosts.primaryTerms, m_boosts.primaryBoost);
    collect(m_boosts.secondaryTerms, m_boosts.secondaryBoost);

    std::stable_sort(active.begin(), active.end(),
                     [](const ActiveLiteral& lhs, const ActiveLiteral& rhs) {
                         return lhs.boost > rhs.boost;
                     });
    return active;
}

double SemanticScorer::literalBoost(const QString& queryText, const QString& chunkText) const
{
    const std::vector<ActiveLiteral> active = activeLiterals(queryText);
    if (active.empty()) {
        return 0.0;
    }
    const QString foldedChunk = thai::foldCompact(chunkText);
    for (const ActiveLiteral& literal : active) {
        if (foldedChunk.contains(literal.folded)) {
            return literal.boost;
        }
    }
    return 0.0;
}

SemanticScores SemanticScorer::score(const std::vector<float>& queryEmbedding,
                                     const std::vector<Chunk>& candidates,
                                     const QString& queryText) const
{
    SemanticScores scores;
    if (queryEmbedding.empty()) {
        return scores;
    }
    scores.reserve(candidates.size());

    const std::vector<ActiveLiteral> active = activeLiterals(queryText);
    int skipped = 0;
    int boosted = 0;

    for (const Chunk& chunk : candidates) {
        const std::optional<double> cosine = cosineSimilarity(queryEmbedding, chunk.embedding);
        if (!cosine.has_value()) {
            ++skipped;
            continue;
        }

        double value = *cosine;
        if (!active.empty()) {
            const QString foldedChunk = thai::foldCompact(chunk.content);
            for (const ActiveLiteral& literal : active) {
                if (foldedChunk.contains(literal.folded)) {
                    value = std::min(1.0, value + literal.boost);
                    ++boosted;
                    break;
                }
            }
        }
        scores.emplace(chunk.chunkId, value);
    }

    if (skipped > 0) {
        LOG_WARN(drRanking, "Semantic scoring skipped %d chunks with unusable embeddings "
                            "(query dimensions=%d)",
                 skipped, static_cast<int>(queryEmbedding.size()));
    }
    if (boosted > 0) {
        LOG_DEBUG(drRanking, "Literal boost applied to %d chunks", boosted);
    }
    return scores;
}

} // namespace dr
