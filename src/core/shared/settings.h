#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace dr {

struct Settings {
    // Chunk store
    QString dbPath;

    // Thai word segmenter (external process; empty program disables it)
    QString segmenterProgram;
    QStringList segmenterArguments;
    uint32_t segmenterTimeoutMs = 5000;

    // Embedding provider (external process)
    QString embeddingProgram;
    QStringList embeddingArguments;
    int embeddingDimensions = 1536;
    uint32_t embeddingTimeoutMs = 10000;

    // Whole-query budget; an expired query returns no results
    uint32_t queryTimeoutMs = 30000;

    // Default search parameters
    double keywordWeight = 0.5;
    double vectorWeight = 0.5;
    double massFraction = 0.3;
    int minChunks = 2;
    int documentScopedMinChunks = 5;
    int maxChunks = 8;

    // Literal override boosts for rare proper nouns
    QStringList primaryBoostTerms = {
        QStringLiteral("xolo"),
        QStringLiteral("kamu"),
    };
    QStringList secondaryBoostTerms = {
        QStringLiteral("bangkapi"),
        QStringLiteral("บางกะปิ"),
        QStringLiteral("เดอะมอล"),
    };
    double primaryBoost = 0.8;
    double secondaryBoost = 0.3;
};

} // namespace dr
