#pragma once

#include <QString>
#include <cstdint>
#include <optional>
#include <vector>

namespace dr {

// Which chunks a query may see. Built per call by the caller.
struct SearchScope {
    QString ownerId;
    std::optional<std::vector<int64_t>> documentIdAllowList;

    bool isDocumentScoped() const
    {
        return documentIdAllowList.has_value() && !documentIdAllowList->empty();
    }
};

// Per-call fusion and selection parameters.
// keywordWeight=1/vectorWeight=0 is keyword-only search, the reverse is
// vector-only search; anything else is hybrid.
struct SearchParams {
    static constexpr int kDefaultMinChunks = 2;
    static constexpr int kDefaultDocumentScopedMinChunks = 5;
    static constexpr int kDefaultMaxChunks = 8;

    double keywordWeight = 0.5;
    double vectorWeight = 0.5;
    double massFraction = 0.3;
    int minChunks = kDefaultMinChunks;
    int maxChunks = kDefaultMaxChunks;

    // `base` with minChunks raised to `documentScopedMinChunks` for
    // document-scoped queries (maxChunks follows when it would fall below).
    static SearchParams defaultsFor(const SearchScope& scope,
                                    const SearchParams& base,
                                    int documentScopedMinChunks = kDefaultDocumentScopedMinChunks);
    static SearchParams defaultsFor(const SearchScope& scope);

    // Returns a description of the first invalid field, or nullopt.
    std::optional<QString> validate() const;
};

} // namespace dr
