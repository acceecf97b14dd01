#pragma once

#include "core/ranking/lexical_scorer.h"
#include "core/ranking/score_normalizer.h"
#include "core/ranking/semantic_scorer.h"
#include "core/shared/chunk.h"
#include "core/shared/search_options.h"
#include "core/shared/search_result.h"

#include <cstdint>
#include <vector>

namespace dr {

struct FusedCandidate {
    const Chunk* chunk = nullptr;
    double lexicalRaw = 0.0;
    double lexicalNormalized = 0.0;
    double semantic = 0.0;
    double finalScore = 0.0;
    bool semanticFloorApplied = false;
    QStringList matchedTerms;
};

// Single fusion + mass-selection path for every caller; keyword-only,
// vector-only and hybrid search differ only in the weights passed in.
class SearchMerger {
public:
    static constexpr double kSemanticFloorFraction = 0.10;

    // Normalize, fuse, rank and mass-select. Results are ordered by
    // finalScore descending.
    static std::vector<RankedResult> merge(const std::vector<Chunk>& candidates,
                                           const LexicalScores& lexicalScores,
                                           const SemanticScores& semanticScores,
                                           const SearchParams& params);

    // finalScore = normalizedLexical * keywordWeight + semantic * vectorWeight
    // for every chunk present in either map, ranked, non-positive dropped.
    static std::vector<FusedCandidate> fuse(const std::vector<Chunk>& candidates,
                                            const LexicalScores& lexicalScores,
                                            const SemanticScores& semanticScores,
                                            const ScoreNormalizer& normalizer,
                                            double keywordWeight,
                                            double vectorWeight);

    // Baseline semantic score for lexical hits the embedding missed:
    // 10% of the mean positive semantic score.
    static double semanticFloor(const SemanticScores& semanticScores);

    // Smallest prefix of `ranked` whose cumulative finalScore reaches
    // massFraction of the total, but never fewer than minChunks and never
    // more than maxChunks. Zero total mass selects nothing.
    static std::vector<FusedCandidate> selectByMass(std::vector<FusedCandidate> ranked,
                                                    double massFraction,
                                                    int minChunks,
                                                    int maxChunks);

    static RankedResult toRankedResult(const FusedCandidate& candidate);
};

} // namespace dr
