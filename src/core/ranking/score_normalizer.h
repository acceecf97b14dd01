#pragma once

#include <QString>
#include <vector>

namespace dr {

enum class NormalizationMethod {
    Identity,       // fewer than two positive scores
    MinMax,         // compact distribution
    ZScoreSigmoid,  // heavy tail / high variance
};

QString normalizationMethodToString(NormalizationMethod method);

// Rescales the raw lexical scores of one query into [0, 1]. BM25 scores are
// unbounded and their spread depends on query term rarity, so the method
// is picked from the distribution of the positive scores.
class ScoreNormalizer {
public:
    static constexpr double kEpsilon = 1e-8;
    static constexpr double kMaxCoefficientOfVariation = 1.0;
    static constexpr double kMaxRangeToMeanRatio = 3.0;
    static constexpr double kZScoreClip = 3.0;

    struct Stats {
        int count = 0;
        double min = 0.0;
        double max = 0.0;
        double mean = 0.0;
        double stddev = 0.0;  // population
        double coefficientOfVariation = 0.0;
    };

    // Fit to the positive entries of `rawScores`; others are ignored.
    static ScoreNormalizer fit(const std::vector<double>& rawScores);

    // Zero and negative inputs map to 0.
    double normalize(double raw) const;

    NormalizationMethod method() const { return m_method; }
    const Stats& stats() const { return m_stats; }

private:
    NormalizationMethod m_method = NormalizationMethod::Identity;
    Stats m_stats;
};

} // namespace dr
