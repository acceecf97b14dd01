#include "core/ranking/score_normalizer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace dr {

QString normalizationMethodToString(NormalizationMethod method)
{
    switch (method) {
    case NormalizationMethod::Identity:      return QStringLiteral("identity");
    case NormalizationMethod::MinMax:        return QStringLiteral("minMax");
    case NormalizationMethod::ZScoreSigmoid: return QStringLiteral("zScoreSigmoid");
    }
    return QStringLiteral("unknown");
}

ScoreNormalizer ScoreNormalizer::fit(const std::vector<double>& rawScores)
{
    ScoreNormalizer normalizer;

    std::vector<double> positive;
    positive.reserve(rawScores.size());
    for (double score : rawScores) {
        if (score > 0.0 && std::isfinite(score)) {
            positive.push_back(score);
        }
    }

    Stats& stats = normalizer.m_stats;
    stats.count = static_cast<int>(positive.size());
    if (positive.size() < 2) {
        if (!positive.empty()) {
            stats.min = stats.max = stats.mean = positive.front();
        }
        normalizer.m_method = NormalizationMethod::Identity;
        return normalizer;
    }

    const auto [minIt, maxIt] = std::minmax_element(positive.begin(), positive.end());
    stats.min = *minIt;
    stats.max = *maxIt;

    double sum = 0.0;
    for (double score : positive) {
        sum += score;
    }
    stats.mean = sum / static_cast<double>(positive.size());

    double squaredDeviation = 0.0;
    for (double score : positive) {
        squaredDeviation += (score - stats.mean) * (score - stats.mean);
    }
    stats.stddev = std::sqrt(squaredDeviation / static_cast<double>(positive.size()));
    stats.coefficientOfVariation = stats.stddev / (stats.mean + kEpsilon);

    const double range = stats.max - stats.min;
    if (stats.coefficientOfVariation > kMaxCoefficientOfVariation
        || range > kMaxRangeToMeanRatio * stats.mean) {
        normalizer.m_method = NormalizationMethod::ZScoreSigmoid;
    } else {
        normalizer.m_method = NormalizationMethod::MinMax;
    }

    LOG_DEBUG(drRanking, "Lexical stats n=%d min=%.4f max=%.4f mean=%.4f std=%.4f cv=%.2f -> %s",
              stats.count, stats.min, stats.max, stats.mean, stats.stddev,
              stats.coefficientOfVariation,
              qUtf8Printable(normalizationMethodToString(normalizer.m_method)));
    return normalizer;
}

double ScoreNormalizer::normalize(double raw) const
{
    if (!(raw > 0.0) || !std::isfinite(raw)) {
        return 0.0;
    }

    switch (m_method) {
    case NormalizationMethod::Identity:
        return raw;
    case NormalizationMethod::ZScoreSigmoid: {
        const double z = (raw - m_stats.mean) / (m_stats.stddev + kEpsilon);
        const double clipped = std::clamp(z, -kZScoreClip, kZScoreClip);
        return 1.0 / (1.0 + std::exp(-clipped));
    }
    case NormalizationMethod::MinMax: {
        // Identical scores collapse to 0: none of them stands out.
        const double range = m_stats.max - m_stats.min;
        return std::clamp((raw - m_stats.min) / (range + kEpsilon), 0.0, 1.0);
    }
    }
    return 0.0;
}

} // namespace dr
