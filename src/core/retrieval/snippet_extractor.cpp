#include "core/retrieval/snippet_extractor.h"

#include <algorithm>

namespace dr {

QStringList SnippetExtractor::extract(const QString& content, const QStringList& terms)
{
    QStringList snippets;
    if (content.isEmpty()) {
        return snippets;
    }

    for (const QString& term : terms) {
        if (term.isEmpty()) {
            continue;
        }
        int perTerm = 0;
        int from = 0;
        while (perTerm < kMaxPerTerm && snippets.size() < kMaxTotal) {
            const int index = content.indexOf(term, from, Qt::CaseInsensitive);
            if (index < 0) {
                break;
            }
            const int start = std::max(0, index - kContextChars);
            const int end = std::min(static_cast<int>(content.size()),
                                     index + static_cast<int>(term.size()) + kContextChars);

            QString snippet = content.mid(start, end - start);
            if (start > 0) {
                snippet.prepend(QStringLiteral("..."));
            }
            if (end < content.size()) {
                snippet.append(QStringLiteral("..."));
            }
            snippets.append(snippet);

            ++perTerm;
            from = index + static_cast<int>(term.size());
        }
        if (snippets.size() >= kMaxTotal) {
            break;
        }
    }
    return snippets;
}

} // namespace dr
