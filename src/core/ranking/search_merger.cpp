#include "core/ranking/search_merger.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dr {

namespace {

bool rankBefore(const FusedCandidate& lhs, const FusedCandidate& rhs)
{
    if (lhs.finalScore != rhs.finalScore) {
        return lhs.finalScore > rhs.finalScore;
    }
    if (lhs.chunk->documentId != rhs.chunk->documentId) {
        return lhs.chunk->documentId < rhs.chunk->documentId;
    }
    return lhs.chunk->chunkIndex < rhs.chunk->chunkIndex;
}

} // namespace

double SearchMerger::semanticFloor(const SemanticScores& semanticScores)
{
    double sum = 0.0;
    int count = 0;
    for (const auto& [chunkId, score] : semanticScores) {
        if (score > 0.0) {
            sum += score;
            ++count;
        }
    }
    if (count == 0) {
        return 0.0;
    }
    return kSemanticFloorFraction * (sum / static_cast<double>(count));
}

std::vector<FusedCandidate> SearchMerger::fuse(const std::vector<Chunk>& candidates,
                                               const LexicalScores& lexicalScores,
                                               const SemanticScores& semanticScores,
                                               const ScoreNormalizer& normalizer,
                                               double keywordWeight,
                                               double vectorWeight)
{
    // The floor only protects lexical hits, so it is moot without a keyword weight.
    const double floor = keywordWeight > 0.0 ? semanticFloor(semanticScores) : 0.0;

    std::vector<FusedCandidate> fused;
    fused.reserve(std::max(lexicalScores.size(), semanticScores.size()));

    for (const Chunk& chunk : candidates) {
        const auto lexicalIt = lexicalScores.find(chunk.chunkId);
        const auto semanticIt = semanticScores.find(chunk.chunkId);
        const bool hasLexical = lexicalIt != lexicalScores.end();
        const bool hasSemantic = semanticIt != semanticScores.end();
        if (!hasLexical && !hasSemantic) {
            continue;
        }

        FusedCandidate candidate;
        candidate.chunk = &chunk;
        if (hasLexical) {
            candidate.lexicalRaw = lexicalIt->second.score;
            candidate.lexicalNormalized = normalizer.normalize(candidate.lexicalRaw);
            candidate.matchedTerms = lexicalIt->second.matchedTerms;
        }
        if (hasSemantic) {
            candidate.semantic = semanticIt->second;
        }

        if (candidate.lexicalRaw > 0.0 && candidate.semantic == 0.0 && floor > 0.0) {
            candidate.semantic = floor;
            candidate.semanticFloorApplied = true;
        }

        candidate.finalScore = candidate.lexicalNormalized * keywordWeight
                               + candidate.semantic * vectorWeight;
        if (!(candidate.finalScore > 0.0) || !std::isfinite(candidate.finalScore)) {
            continue;
        }
        fused.push_back(std::move(candidate));
    }

    std::sort(fused.begin(), fused.end(), rankBefore);
    return fused;
}

std::vector<FusedCandidate> SearchMerger::selectByMass(std::vector<FusedCandidate> ranked,
                                                       double massFraction,
                                                       int minChunks,
                                                       int maxChunks)
{
    std::vector<FusedCandidate> selected;
    if (ranked.empty() || maxChunks <= 0) {
        return selected;
    }

    double total = 0.0;
    for (const FusedCandidate& candidate : ranked) {
        total += candidate.finalScore;
    }
    if (!(total > 0.0)) {
        return selected;
    }

    const size_t ceiling = static_cast<size_t>(maxChunks);
    const size_t floorCount = static_cast<size_t>(std::max(minChunks, 0));
    double accumulated = 0.0;
    for (FusedCandidate& candidate : ranked) {
        accumulated += candidate.finalScore;
        selected.push_back(std::move(candidate));

        const bool massReached = accumulated / total >= massFraction;
        if (massReached && selected.size() >= floorCount) {
            break;
        }
        if (selected.size() >= ceiling) {
            break;
        }
    }

    LOG_DEBUG(drRanking, "Mass selection kept %d of %d chunks (%.1f%% of mass, target %.1f%%)",
              static_cast<int>(selected.size()), static_cast<int>(ranked.size()),
              100.0 * accumulated / total, 100.0 * massFraction);
    return selected;
}

RankedResult SearchMerger::toRankedResult(const FusedCandidate& candidate)
{
    RankedResult result;
    result.chunkId = candidate.chunk->chunkId;
    result.documentId = candidate.chunk->documentId;
    result.chunkIndex = candidate.chunk->chunkIndex;
    result.content = candidate.chunk->content;
    result.finalScore = candidate.finalScore;
    result.lexicalScore = candidate.lexicalNormalized;
    result.semanticScore = candidate.semantic;
    result.matchedTerms = candidate.matchedTerms;
    return result;
}

std::vector<RankedResult> SearchMerger::merge(const std::vector<Chunk>& candidates,
                                              const LexicalScores& lexicalScores,
                                              const SemanticScores& semanticScores,
                                              const SearchParams& params)
{
    std::vector<double> rawLexical;
    rawLexical.reserve(lexicalScores.size());
    for (const auto& [chunkId, match] : lexicalScores) {
        rawLexical.push_back(match.score);
    }
    const ScoreNormalizer normalizer = ScoreNormalizer::fit(rawLexical);

    std::vector<FusedCandidate> ranked = fuse(candidates, lexicalScores, semanticScores,
                                              normalizer, params.keywordWeight,
                                              params.vectorWeight);
    const std::vector<FusedCandidate> selected =
        selectByMass(std::move(ranked), params.massFraction, params.minChunks, params.maxChunks);

    std::vector<RankedResult> results;
    results.reserve(selected.size());
    for (const FusedCandidate& candidate : selected) {
        results.push_back(toRankedResult(candidate));
    }
    return results;
}

} // namespace dr
