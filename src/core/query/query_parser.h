#pragma once

#include <QString>
#include <QStringList>

#include <memory>

namespace dr {

class WordSegmenter;

struct ParsedQuery {
    QString original;
    QStringList tokens;   // every normalized token, in query order
    QStringList terms;    // scoring terms: phrases first, then filtered unique tokens
    bool segmented = false;
};

// Turns raw query text into normalized tokens and scoring terms.
// Thai-dense text is sent through the segmenter first; a failing segmenter
// degrades to the unsegmented text and never fails the parse.
class QueryParser {
public:
    explicit QueryParser(std::shared_ptr<WordSegmenter> segmenter = nullptr);

    ParsedQuery parse(const QString& raw) const;

    // Segment-if-dense, collapse whitespace, tokenize.
    QStringList normalize(const QString& text) const;

    static bool isStopWord(const QString& token);

private:
    // Returns the text with word boundaries inserted, or the input
    // unchanged. `segmented` reports whether the segmenter was applied.
    QString segmentIfThaiDense(const QString& text, bool* segmented) const;

    std::shared_ptr<WordSegmenter> m_segmenter;
};

} // namespace dr
