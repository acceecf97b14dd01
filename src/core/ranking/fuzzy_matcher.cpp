#include "core/ranking/fuzzy_matcher.h"
#include "core/text/thai_text.h"

#include <QRegularExpression>
#include <QStringList>
#include <QVector>

#include <algorithm>
#include <cstdlib>

namespace dr {

namespace {

double lengthRatio(const QString& a, const QString& b)
{
    const int longer = std::max(a.size(), b.size());
    if (longer == 0) {
        return 0.0;
    }
    return static_cast<double>(std::min(a.size(), b.size())) / static_cast<double>(longer);
}

bool mutuallyContains(const QString& a, const QString& b)
{
    return a.contains(b) || b.contains(a);
}

// Upper bound on similarity() given only the lengths.
double similarityCeiling(const QString& a, const QString& b)
{
    const int longer = std::max(a.size(), b.size());
    if (longer == 0) {
        return 1.0;
    }
    const int gap = std::abs(a.size() - b.size());
    return static_cast<double>(longer - gap) / static_cast<double>(longer);
}

} // namespace

int cascadeLevel(MatchTier tier)
{
    switch (tier) {
    case MatchTier::None:          return 0;
    case MatchTier::Exact:         return 1;
    case MatchTier::LanguageFuzzy: return 2;
    case MatchTier::GenericFuzzy:  return 2;
    case MatchTier::Partial:       return 3;
    case MatchTier::Substring:     return 4;
    }
    return 0;
}

double tierDiscount(MatchTier tier)
{
    switch (tier) {
    case MatchTier::None:          return 0.0;
    case MatchTier::Exact:         return 1.0;
    case MatchTier::LanguageFuzzy: return 0.9;
    case MatchTier::GenericFuzzy:  return 0.8;
    case MatchTier::Partial:       return 0.7;
    case MatchTier::Substring:     return 0.6;
    }
    return 0.0;
}

QString matchTierToString(MatchTier tier)
{
    switch (tier) {
    case MatchTier::None:          return QStringLiteral("none");
    case MatchTier::Exact:         return QStringLiteral("exact");
    case MatchTier::LanguageFuzzy: return QStringLiteral("languageFuzzy");
    case MatchTier::GenericFuzzy:  return QStringLiteral("genericFuzzy");
    case MatchTier::Partial:       return QStringLiteral("partial");
    case MatchTier::Substring:     return QStringLiteral("substring");
    }
    return QStringLiteral("unknown");
}

int FuzzyMatcher::editDistance(const QString& a, const QString& b)
{
    const int aLen = a.size();
    const int bLen = b.size();

    if (a == b) {
        return 0;
    }
    if (aLen == 0) {
        return bLen;
    }
    if (bLen == 0) {
        return aLen;
    }

    QVector<int> prev(bLen + 1);
    QVector<int> curr(bLen + 1);
    for (int j = 0; j <= bLen; ++j) {
        prev[j] = j;
    }

    for (int i = 1; i <= aLen; ++i) {
        curr[0] = i;
        for (int j = 1; j <= bLen; ++j) {
            const int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            const int deletion = prev[j] + 1;
            const int insertion = curr[j - 1] + 1;
            const int substitution = prev[j - 1] + cost;
            curr[j] = std::min({deletion, insertion, substitution});
        }
        std::swap(prev, curr);
    }

    return prev[bLen];
}

double FuzzyMatcher::similarity(const QString& a, const QString& b)
{
    if (a == b) {
        return 1.0;
    }
    const int longer = std::max(a.size(), b.size());
    if (longer == 0) {
        return 1.0;
    }
    const int distance = editDistance(a, b);
    return static_cast<double>(longer - distance) / static_cast<double>(longer);
}

double FuzzyMatcher::thaiSimilarity(const QString& a, const QString& b)
{
    return similarity(thai::fold(a), thai::fold(b));
}

TermMatch FuzzyMatcher::matchLanguageAware(const QString& term, const QString& token)
{
    if (thai::containsThai(term)) {
        const QString foldedTerm = thai::foldCompact(term);
        const QString foldedToken = thai::foldCompact(token);
        if (foldedTerm.isEmpty() || foldedToken.isEmpty()) {
            return {};
        }
        if (foldedTerm == foldedToken) {
            return {MatchTier::LanguageFuzzy, kThaiFoldedEqualQuality};
        }
        if (std::min(foldedTerm.size(), foldedToken.size()) >= kMinContainmentLength
            && mutuallyContains(foldedTerm, foldedToken)) {
            return {MatchTier::LanguageFuzzy, kThaiContainmentQuality};
        }
        if (std::abs(foldedTerm.size() - foldedToken.size()) <= kThaiMaxLengthGap) {
            const double sim = similarity(foldedTerm, foldedToken);
            if (sim >= kThaiSimilarityThreshold) {
                return {MatchTier::LanguageFuzzy, sim};
            }
        }
        return {};
    }

    if (similarityCeiling(term, token) < kGenericSimilarityThreshold) {
        return {};
    }
    const double sim = similarity(term, token);
    if (sim >= kGenericSimilarityThreshold) {
        return {MatchTier::GenericFuzzy, sim};
    }
    return {};
}

TermMatch FuzzyMatcher::matchPartial(const QString& term, const QString& token)
{
    if (term.size() < kMinContainmentLength || token.size() < kMinContainmentLength) {
        return {};
    }
    if (!mutuallyContains(term, token)) {
        return {};
    }
    return {MatchTier::Partial, std::max(lengthRatio(term, token), kPartialQualityFloor)};
}

TermMatch FuzzyMatcher::matchCompoundSubstring(const QString& term, const QString& token)
{
    static const QRegularExpression kWhitespace(QStringLiteral("\\s+"));

    const QStringList parts = term.split(kWhitespace, Qt::SkipEmptyParts);
    const bool thaiToken = thai::containsThai(token);
    double best = 0.0;

    for (const QString& part : parts) {
        if (part.size() < kMinContainmentLength) {
            continue;
        }
        double value = 0.0;
        if (token.contains(part)
            || (token.size() >= kMinContainmentLength && part.contains(token))) {
            value = lengthRatio(part, token);
        } else if (thaiToken && thai::containsThai(part)) {
            const double sim = thaiSimilarity(part, token);
            if (sim > kSubstringThaiSimilarityThreshold) {
                value = sim;
            }
        }
        best = std::max(best, value);
    }

    if (best <= 0.0) {
        return {};
    }
    return {MatchTier::Substring, std::max(best, kSubstringQualityFloor)};
}

TermMatch FuzzyMatcher::match(const QString& term, const QString& token)
{
    if (term.isEmpty() || token.isEmpty()) {
        return {};
    }
    if (term == token) {
        return {MatchTier::Exact, 1.0};
    }

    TermMatch result = matchLanguageAware(term, token);
    if (result.matched()) {
        return result;
    }
    result = matchPartial(term, token);
    if (result.matched()) {
        return result;
    }
    return matchCompoundSubstring(term, token);
}

} // namespace dr
