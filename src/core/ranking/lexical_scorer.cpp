#include "core/ranking/lexical_scorer.h"
#include "core/query/text_normalizer.h"
#include "core/shared/logging.h"

#include <QRegularExpression>

#include <algorithm>
#include <array>
#include <cmath>

namespace dr {

namespace {

struct ChunkTokens {
    QStringList tokens;
    std::unordered_map<QString, int> counts;
};

int countPhraseOccurrences(const QStringList& phraseTokens, const QStringList& tokens)
{
    const int phraseLength = static_cast<int>(phraseTokens.size());
    const int tokenCount = static_cast<int>(tokens.size());
    if (phraseLength == 0 || phraseLength > tokenCount) {
        return 0;
    }

    int occurrences = 0;
    for (int start = 0; start + phraseLength <= tokenCount; ++start) {
        bool matches = true;
        for (int offset = 0; offset < phraseLength; ++offset) {
            if (tokens[start + offset] != phraseTokens[offset]) {
                matches = false;
                break;
            }
        }
        if (matches) {
            ++occurrences;
        }
    }
    return occurrences;
}

} // namespace

LexicalScorer::LexicalScorer(Bm25Params params)
    : m_params(params)
{
}

double LexicalScorer::inverseDocumentFrequency(int totalDocs, int docFreq)
{
    const double n = static_cast<double>(std::max(totalDocs, 0));
    const double df = static_cast<double>(std::clamp(docFreq, 0, std::max(totalDocs, 0)));
    return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

double LexicalScorer::saturatedTermFrequency(double tf, double docLength,
                                             double avgDocLength) const
{
    if (tf <= 0.0) {
        return 0.0;
    }
    const double lengthRatio = avgDocLength > 0.0 ? docLength / avgDocLength : 1.0;
    const double denominator =
        tf + m_params.k1 * (1.0 - m_params.b + m_params.b * lengthRatio);
    return (tf * (m_params.k1 + 1.0)) / denominator;
}

LexicalScorer::TermEvaluation LexicalScorer::evaluateTerm(
    const QString& term,
    const QStringList& chunkTokens,
    const std::unordered_map<QString, int>& tokenCounts)
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));

    TermEvaluation evaluation;
    if (term.isEmpty()) {
        return evaluation;
    }

    // Tier 1: exact token, or contiguous token sequence for phrase terms.
    const QStringList phraseTokens = term.split(kWhitespace, Qt::SkipEmptyParts);
    if (phraseTokens.size() > 1) {
        const int occurrences = countPhraseOccurrences(phraseTokens, chunkTokens);
        if (occurrences > 0) {
            evaluation.match = {MatchTier::Exact, 1.0};
            evaluation.tf = occurrences;
            return evaluation;
        }
    } else {
        const auto exact = tokenCounts.find(term);
        if (exact != tokenCounts.end()) {
            evaluation.match = {MatchTier::Exact, 1.0};
            evaluation.tf = exact->second;
            return evaluation;
        }
    }

    // Tiers 2-4: best quality and matching-token count per cascade level.
    std::array<double, 5> bestQuality{};
    std::array<MatchTier, 5> bestTier{};
    std::array<int, 5> tokenHits{};
    bestTier.fill(MatchTier::None);

    for (const auto& [token, count] : tokenCounts) {
        const TermMatch match = FuzzyMatcher::match(term, token);
        if (!match.matched()) {
            continue;
        }
        const int level = cascadeLevel(match.tier);
        tokenHits[level] += count;
        if (match.quality > bestQuality[level]) {
            bestQuality[level] = match.quality;
            bestTier[level] = match.tier;
        }
    }

    for (int level = 2; level <= 4; ++level) {
        if (tokenHits[level] > 0) {
            evaluation.match = {bestTier[level], bestQuality[level]};
            evaluation.tf = tokenHits[level];
            return evaluation;
        }
    }
    return evaluation;
}

LexicalScores LexicalScorer::score(const QStringList& queryTerms,
                                   const std::vector<Chunk>& candidates) const
{
    LexicalScores scores;
    if (queryTerms.isEmpty() || candidates.empty()) {
        return scores;
    }

    std::vector<ChunkTokens> tokenized;
    tokenized.reserve(candidates.size());
    double totalLength = 0.0;
    for (const Chunk& chunk : candidates) {
        ChunkTokens entry;
        entry.tokens = TextNormalizer::tokenize(chunk.content);
        for (const QString& token : entry.tokens) {
            ++entry.counts[token];
        }
        totalLength += static_cast<double>(entry.tokens.size());
        tokenized.push_back(std::move(entry));
    }

    const int totalDocs = static_cast<int>(candidates.size());
    const double avgDocLength = totalLength > 0.0 ? totalLength / totalDocs : 1.0;

    // First pass: cascade outcome per (term, chunk), and document frequency.
    std::vector<std::vector<TermEvaluation>> evaluations(
        static_cast<size_t>(queryTerms.size()));
    std::vector<int> docFreq(static_cast<size_t>(queryTerms.size()), 0);
    for (int t = 0; t < queryTerms.size(); ++t) {
        auto& row = evaluations[static_cast<size_t>(t)];
        row.reserve(candidates.size());
        for (const ChunkTokens& entry : tokenized) {
            TermEvaluation evaluation;
            if (!entry.tokens.isEmpty()) {
                evaluation = evaluateTerm(queryTerms[t], entry.tokens, entry.counts);
            }
            if (evaluation.match.matched()) {
                ++docFreq[static_cast<size_t>(t)];
            }
            row.push_back(evaluation);
        }
    }

    // Second pass: BM25 contribution weighted by match quality and tier.
    for (size_t c = 0; c < candidates.size(); ++c) {
        const double docLength = static_cast<double>(tokenized[c].tokens.size());
        LexicalMatch match;
        for (int t = 0; t < queryTerms.size(); ++t) {
            const TermEvaluation& evaluation = evaluations[static_cast<size_t>(t)][c];
            if (!evaluation.match.matched()) {
                continue;
            }
            const double idf = inverseDocumentFrequency(totalDocs, docFreq[static_cast<size_t>(t)]);
            const double tfComponent = saturatedTermFrequency(
                static_cast<double>(evaluation.tf), docLength, avgDocLength);
            match.score += idf * tfComponent * evaluation.match.weight();
            match.matchedTerms.append(queryTerms[t]);
        }

        if (match.score > 0.0) {
            scores.emplace(candidates[c].chunkId, std::move(match));
        }
    }

    LOG_DEBUG(drRanking, "BM25: %d of %d chunks matched %d terms (avgLen=%.1f)",
              static_cast<int>(scores.size()), totalDocs,
              static_cast<int>(queryTerms.size()), avgDocLength);
    return scores;
}

} // namespace dr
