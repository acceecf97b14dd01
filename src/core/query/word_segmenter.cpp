#include "core/query/word_segmenter.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QProcess>

#include <algorithm>
#include <utility>

namespace dr {

ProcessWordSegmenter::ProcessWordSegmenter(QString program, QStringList arguments,
                                           int timeoutMs)
    : m_program(std::move(program))
    , m_arguments(std::move(arguments))
    , m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs)
{
}

std::optional<QString> ProcessWordSegmenter::segment(const QString& text)
{
    if (m_program.isEmpty() || text.trimmed().isEmpty()) {
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();

    QProcess process;
    process.start(m_program, m_arguments);
    if (!process.waitForStarted(m_timeoutMs)) {
        LOG_WARN(drQuery, "Segmenter failed to start: %s", qUtf8Printable(m_program));
        return std::nullopt;
    }

    process.write(text.toUtf8());
    process.closeWriteChannel();

    const int remainingMs = std::max(1, m_timeoutMs - static_cast<int>(timer.elapsed()));
    if (!process.waitForFinished(remainingMs)) {
        process.kill();
        process.waitForFinished();
        LOG_WARN(drQuery, "Segmenter timed out after %d ms", m_timeoutMs);
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString stderrText = QString::fromUtf8(process.readAllStandardError()).trimmed();
        LOG_WARN(drQuery, "Segmenter exited with code %d: %s",
                 process.exitCode(), qUtf8Printable(stderrText.left(300)));
        return std::nullopt;
    }

    const QString segmented = QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    if (segmented.isEmpty()) {
        LOG_WARN(drQuery, "Segmenter returned empty output");
        return std::nullopt;
    }

    LOG_DEBUG(drQuery, "Segmented %d chars in %lld ms",
              static_cast<int>(text.size()), static_cast<long long>(timer.elapsed()));
    return segmented;
}

} // namespace dr
