#pragma once

#include "core/shared/chunk.h"
#include "core/ranking/fuzzy_matcher.h"

#include <QString>
#include <QStringList>
#include <unordered_map>
#include <vector>

namespace dr {

struct Bm25Params {
    double k1 = 1.2;
    double b = 0.75;
};

struct LexicalMatch {
    double score = 0.0;
    QStringList matchedTerms;
};

// chunkId -> match. Chunks without a qualifying term are absent.
using LexicalScores = std::unordered_map<QString, LexicalMatch>;

// Okapi BM25 over a candidate set, with a 4-tier fuzzy cascade per
// (term, chunk) pair. Chunk text is tokenized without segmentation; only
// the query side is ever segmented.
class LexicalScorer {
public:
    explicit LexicalScorer(Bm25Params params = {});

    LexicalScores score(const QStringList& queryTerms,
                        const std::vector<Chunk>& candidates) const;

    // ln(1 + (N - df + 0.5) / (df + 0.5)); never negative.
    static double inverseDocumentFrequency(int totalDocs, int docFreq);

    // tf * (k1 + 1) / (tf + k1 * (1 - b + b * docLength / avgDocLength))
    double saturatedTermFrequency(double tf, double docLength, double avgDocLength) const;

    const Bm25Params& params() const { return m_params; }

    // Outcome of the cascade for one (term, chunk) pair. tf counts the
    // chunk tokens that matched at the winning tier.
    struct TermEvaluation {
        TermMatch match;
        int tf = 0;
    };

    static TermEvaluation evaluateTerm(const QString& term,
                                       const QStringList& chunkTokens,
                                       const std::unordered_map<QString, int>& tokenCounts);

private:
    Bm25Params m_params;
};

} // namespace dr
