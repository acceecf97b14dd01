#include "core/shared/search_result.h"

#include <QJsonArray>

namespace dr {

QString searchStatusToString(SearchStatus status)
{
    switch (status) {
    case SearchStatus::Ok:                  return QStringLiteral("ok");
    case SearchStatus::InvalidParams:       return QStringLiteral("invalid_params");
    case SearchStatus::UpstreamUnavailable: return QStringLiteral("upstream_unavailable");
    case SearchStatus::Timeout:             return QStringLiteral("timeout");
    case SearchStatus::InternalError:       return QStringLiteral("internal_error");
    }
    return QStringLiteral("unknown");
}

SearchOutcome SearchOutcome::failure(SearchStatus status, const QString& message)
{
    SearchOutcome outcome;
    outcome.status = status;
    outcome.errorMessage = message;
    return outcome;
}

QJsonObject rankedResultToJson(const RankedResult& result)
{
    QJsonObject json;
    json.insert(QStringLiteral("chunkId"), result.chunkId);
    json.insert(QStringLiteral("documentId"), static_cast<qint64>(result.documentId));
    json.insert(QStringLiteral("chunkIndex"), result.chunkIndex);
    json.insert(QStringLiteral("content"), result.content);
    json.insert(QStringLiteral("finalScore"), result.finalScore);
    json.insert(QStringLiteral("lexicalScore"), result.lexicalScore);
    json.insert(QStringLiteral("semanticScore"), result.semanticScore);
    json.insert(QStringLiteral("matchedTerms"), QJsonArray::fromStringList(result.matchedTerms));
    json.insert(QStringLiteral("snippets"), QJsonArray::fromStringList(result.snippets));
    return json;
}

QJsonObject searchOutcomeToJson(const SearchOutcome& outcome)
{
    QJsonArray results;
    for (const RankedResult& result : outcome.results) {
        results.append(rankedResultToJson(result));
    }

    QJsonObject json;
    json.insert(QStringLiteral("status"), searchStatusToString(outcome.status));
    if (!outcome.errorMessage.isEmpty()) {
        json.insert(QStringLiteral("error"), outcome.errorMessage);
    }
    json.insert(QStringLiteral("results"), results);
    return json;
}

} // namespace dr
