#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <QStringList>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dr {

// Curated literals (brand names, locations) that embeddings tend to
// under-weight. When both the query and a chunk contain one, the chunk's
// semantic score is raised by the matching boost, capped at 1.0.
struct LiteralBoostConfig {
    QStringList primaryTerms;
    QStringList secondaryTerms;
    double primaryBoost = 0.8;
    double secondaryBoost = 0.3;

    bool isEmpty() const { return primaryTerms.isEmpty() && secondaryTerms.isEmpty(); }
};

// chunkId -> cosine similarity (after literal boosts).
using SemanticScores = std::unordered_map<QString, double>;

class SemanticScorer {
public:
    explicit SemanticScorer(LiteralBoostConfig boosts = {});

    // Chunks with an empty embedding or one whose dimensionality differs
    // from the query's are skipped, not scored as zero.
    SemanticScores score(const std::vector<float>& queryEmbedding,
                         const std::vector<Chunk>& candidates,
                         const QString& queryText = {}) const;

    // nullopt when either vector is empty, dimensions differ, or a norm is 0.
    static std::optional<double> cosineSimilarity(const std::vector<float>& a,
                                                  const std::vector<float>& b);

    // Largest boost whose literal appears in both texts (0 if none).
    double literalBoost(const QString& queryText, const QString& chunkText) const;

    const LiteralBoostConfig& boosts() const { return m_boosts; }

private:
    struct ActiveLiteral {
        QString folded;
        double boost = 0.0;
    };

    std::vector<ActiveLiteral> activeLiterals(const QString& queryText) const;

    LiteralBoostConfig m_boosts;
};

} // namespace dr
