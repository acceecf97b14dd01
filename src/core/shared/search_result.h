#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <vector>

namespace dr {

struct RankedResult {
    QString chunkId;
    int64_t documentId = 0;
    int chunkIndex = 0;
    QString content;
    double finalScore = 0.0;
    double lexicalScore = 0.0;   // normalized lexical contribution input
    double semanticScore = 0.0;  // cosine similarity after literal boosts / floor
    QStringList matchedTerms;
    QStringList snippets;
};

enum class SearchStatus {
    Ok,
    InvalidParams,
    UpstreamUnavailable,
    Timeout,
    InternalError,
};

QString searchStatusToString(SearchStatus status);

// Result of one search call. Non-Ok outcomes never carry results.
struct SearchOutcome {
    SearchStatus status = SearchStatus::Ok;
    QString errorMessage;
    std::vector<RankedResult> results;

    bool ok() const { return status == SearchStatus::Ok; }

    static SearchOutcome failure(SearchStatus status, const QString& message);
};

QJsonObject rankedResultToJson(const RankedResult& result);
QJsonObject searchOutcomeToJson(const SearchOutcome& outcome);

} // namespace dr
