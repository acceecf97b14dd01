#pragma once

#include <QString>
#include <QStringList>

namespace dr {

// Text -> normalized tokens. Never segments; callers that want Thai word
// boundaries segment first (see QueryParser).
class TextNormalizer {
public:
    // Lowercase, split on whitespace and the fixed punctuation set, drop
    // empty tokens.
    static QStringList tokenize(const QString& text);

    // Collapse every whitespace run to a single space and trim. Single
    // spaces inside pre-segmented Thai text are word boundaries and survive.
    static QString collapseWhitespace(const QString& text);

    static bool isTokenSeparator(QChar ch);
};

} // namespace dr
