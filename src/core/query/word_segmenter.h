#pragma once

#include <QString>
#include <QStringList>

#include <optional>

namespace dr {

// Inserts word boundaries (single spaces) into text written in a script
// without whitespace word delimiters. nullopt means "could not segment";
// callers fall back to the original text.
class WordSegmenter {
public:
    virtual ~WordSegmenter() = default;
    virtual std::optional<QString> segment(const QString& text) = 0;
};

// Runs an external segmenter program: text on stdin, segmented text on
// stdout. Start failure, timeout, non-zero exit and empty output all map to
// nullopt.
class ProcessWordSegmenter : public WordSegmenter {
public:
    static constexpr int kDefaultTimeoutMs = 5000;

    ProcessWordSegmenter(QString program, QStringList arguments,
                         int timeoutMs = kDefaultTimeoutMs);

    std::optional<QString> segment(const QString& text) override;

    const QString& program() const { return m_program; }
    int timeoutMs() const { return m_timeoutMs; }

private:
    QString m_program;
    QStringList m_arguments;
    int m_timeoutMs = kDefaultTimeoutMs;
};

} // namespace dr
