#include "core/shared/search_options.h"

#include <algorithm>
#include <cmath>

namespace dr {

namespace {

bool inUnitInterval(double value)
{
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

} // namespace

SearchParams SearchParams::defaultsFor(const SearchScope& scope,
                                       const SearchParams& base,
                                       int documentScopedMinChunks)
{
    SearchParams params = base;
    if (scope.isDocumentScoped()) {
        params.minChunks = std::max(params.minChunks, documentScopedMinChunks);
        params.maxChunks = std::max(params.maxChunks, params.minChunks);
    }
    return params;
}

SearchParams SearchParams::defaultsFor(const SearchScope& scope)
{
    return defaultsFor(scope, SearchParams{});
}

std::optional<QString> SearchParams::validate() const
{
    if (!inUnitInterval(keywordWeight)) {
        return QStringLiteral("keywordWeight must be within [0, 1], got %1").arg(keywordWeight);
    }
    if (!inUnitInterval(vectorWeight)) {
        return QStringLiteral("vectorWeight must be within [0, 1], got %1").arg(vectorWeight);
    }
    if (keywordWeight + vectorWeight <= 0.0) {
        return QStringLiteral("keywordWeight and vectorWeight must not both be 0");
    }
    if (!std::isfinite(massFraction) || massFraction <= 0.0 || massFraction > 1.0) {
        return QStringLiteral("massFraction must be within (0, 1], got %1").arg(massFraction);
    }
    if (minChunks < 1) {
        return QStringLiteral("minChunks must be at least 1, got %1").arg(minChunks);
    }
    if (maxChunks < minChunks) {
        return QStringLiteral("maxChunks (%1) must not be below minChunks (%2)")
            .arg(maxChunks)
            .arg(minChunks);
    }
    return std::nullopt;
}

} // namespace dr
