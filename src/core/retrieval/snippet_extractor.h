#pragma once

#include <QString>
#include <QStringList>

namespace dr {

// Citation highlights: windows of text around literal occurrences of the
// matched terms, "..." marking a cut at either end.
class SnippetExtractor {
public:
    static constexpr int kContextChars = 100;
    static constexpr int kMaxPerTerm = 3;
    static constexpr int kMaxTotal = 5;

    static QStringList extract(const QString& content, const QStringList& terms);
};

} // namespace dr
