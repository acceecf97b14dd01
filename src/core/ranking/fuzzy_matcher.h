#pragma once

#include <QString>

namespace dr {

// Match tiers in cascade order. LanguageFuzzy and GenericFuzzy share the
// second cascade position: Thai terms use the former, everything else the
// latter.
enum class MatchTier {
    None,
    Exact,
    LanguageFuzzy,
    GenericFuzzy,
    Partial,
    Substring,
};

// Position in the cascade, 1 (exact) .. 4 (compound substring); 0 for None.
int cascadeLevel(MatchTier tier);

// Score multiplier applied on top of the match quality.
double tierDiscount(MatchTier tier);

QString matchTierToString(MatchTier tier);

struct TermMatch {
    MatchTier tier = MatchTier::None;
    double quality = 0.0;

    bool matched() const { return tier != MatchTier::None; }
    double weight() const { return quality * tierDiscount(tier); }
};

class FuzzyMatcher {
public:
    static constexpr double kThaiFoldedEqualQuality = 0.95;
    static constexpr double kThaiContainmentQuality = 0.85;
    static constexpr double kThaiSimilarityThreshold = 0.80;
    static constexpr int kThaiMaxLengthGap = 2;
    static constexpr double kGenericSimilarityThreshold = 0.75;
    static constexpr int kMinContainmentLength = 3;
    static constexpr double kPartialQualityFloor = 0.6;
    static constexpr double kSubstringThaiSimilarityThreshold = 0.7;
    static constexpr double kSubstringQualityFloor = 0.5;

    // Best match of one query term against one chunk token, walking the
    // cascade and stopping at the first tier that matches.
    static TermMatch match(const QString& term, const QString& token);

    static TermMatch matchLanguageAware(const QString& term, const QString& token);
    static TermMatch matchPartial(const QString& term, const QString& token);
    static TermMatch matchCompoundSubstring(const QString& term, const QString& token);

    // Levenshtein distance (insert/delete/substitute, unit cost).
    static int editDistance(const QString& a, const QString& b);

    // 1 - distance / max(len); 1.0 for two empty strings.
    static double similarity(const QString& a, const QString& b);

    // similarity() over tone/vowel-folded Thai text.
    static double thaiSimilarity(const QString& a, const QString& b);
};

} // namespace dr
