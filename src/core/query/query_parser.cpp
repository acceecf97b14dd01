#include "core/query/query_parser.h"
#include "core/query/text_normalizer.h"
#include "core/query/word_segmenter.h"
#include "core/shared/logging.h"
#include "core/text/thai_text.h"

#include <QRegularExpression>
#include <QSet>

#include <utility>

namespace dr {

namespace {

const QSet<QString>& stopWords()
{
    static const QSet<QString> kStopWords = {
        // English
        QStringLiteral("the"), QStringLiteral("a"), QStringLiteral("an"),
        QStringLiteral("and"), QStringLiteral("or"), QStringLiteral("but"),
        QStringLiteral("in"), QStringLiteral("on"), QStringLiteral("at"),
        QStringLiteral("to"), QStringLiteral("for"), QStringLiteral("of"),
        QStringLiteral("with"), QStringLiteral("by"), QStringLiteral("is"),
        QStringLiteral("are"), QStringLiteral("was"), QStringLiteral("were"),
        QStringLiteral("be"), QStringLiteral("been"), QStringLiteral("being"),
        QStringLiteral("have"), QStringLiteral("has"), QStringLiteral("had"),
        QStringLiteral("do"), QStringLiteral("does"), QStringLiteral("did"),
        QStringLiteral("will"), QStringLiteral("would"), QStringLiteral("could"),
        QStringLiteral("should"), QStringLiteral("may"), QStringLiteral("might"),
        QStringLiteral("must"), QStringLiteral("can"), QStringLiteral("this"),
        QStringLiteral("that"), QStringLiteral("these"), QStringLiteral("those"),
        // Thai particles, pronouns and question words
        QStringLiteral("ที่"), QStringLiteral("และ"), QStringLiteral("หรือ"),
        QStringLiteral("แต่"), QStringLiteral("ใน"), QStringLiteral("บน"),
        QStringLiteral("เพื่อ"), QStringLiteral("ของ"), QStringLiteral("กับ"),
        QStringLiteral("โดย"), QStringLiteral("ได้"), QStringLiteral("เป็น"),
        QStringLiteral("มี"), QStringLiteral("จาก"), QStringLiteral("ไป"),
        QStringLiteral("มา"), QStringLiteral("ก็"), QStringLiteral("จะ"),
        QStringLiteral("ถึง"), QStringLiteral("ให้"), QStringLiteral("ยัง"),
        QStringLiteral("คือ"), QStringLiteral("ว่า"), QStringLiteral("นี้"),
        QStringLiteral("นั้น"), QStringLiteral("นะ"), QStringLiteral("ครับ"),
        QStringLiteral("ค่ะ"), QStringLiteral("คะ"), QStringLiteral("ไหม"),
        QStringLiteral("มั้ย"), QStringLiteral("อะไร"), QStringLiteral("เมื่อไหร่"),
        QStringLiteral("ที่ไหน"), QStringLiteral("ทำไม"), QStringLiteral("อย่างไร"),
        QStringLiteral("ใคร"), QStringLiteral("ขอ"), QStringLiteral("ช่วย"),
        QStringLiteral("บอก"), QStringLiteral("ดู"), QStringLiteral("อยู่"),
        QStringLiteral("เอา"), QStringLiteral("ลอง"), QStringLiteral("หา"),
        QStringLiteral("ต้อง"), QStringLiteral("อยาก"), QStringLiteral("ไม่"),
        QStringLiteral("ไม่ได้"), QStringLiteral("ไม่มี"), QStringLiteral("แล้ว"),
        QStringLiteral("เลย"), QStringLiteral("เดี๋ยว"), QStringLiteral("เอง"),
    };
    return kStopWords;
}

void appendUnique(QStringList& list, const QString& value)
{
    if (!value.isEmpty() && !list.contains(value)) {
        list.append(value);
    }
}

} // namespace

QueryParser::QueryParser(std::shared_ptr<WordSegmenter> segmenter)
    : m_segmenter(std::move(segmenter))
{
}

bool QueryParser::isStopWord(const QString& token)
{
    return stopWords().contains(token);
}

QString QueryParser::segmentIfThaiDense(const QString& text, bool* segmented) const
{
    if (segmented) {
        *segmented = false;
    }
    if (!m_segmenter || !thai::isDense(text)) {
        return text;
    }

    const std::optional<QString> result = m_segmenter->segment(text);
    if (!result.has_value()) {
        LOG_WARN(drQuery, "Thai segmentation unavailable, using unsegmented query text");
        return text;
    }

    if (segmented) {
        *segmented = true;
    }
    return *result;
}

QStringList QueryParser::normalize(const QString& text) const
{
    const QString prepared = segmentIfThaiDense(text, nullptr);
    return TextNormalizer::tokenize(TextNormalizer::collapseWhitespace(prepared));
}

ParsedQuery QueryParser::parse(const QString& raw) const
{
    ParsedQuery parsed;
    parsed.original = raw;

    static const QRegularExpression kQuotedPhrase(QStringLiteral("\"([^\"]+)\""));

    // Quoted phrases become single multi-word terms.
    QStringList phraseTerms;
    QString remainder = raw;
    QRegularExpressionMatchIterator it = kQuotedPhrase.globalMatch(raw);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        bool phraseSegmented = false;
        const QString phraseText = segmentIfThaiDense(match.captured(1), &phraseSegmented);
        parsed.segmented = parsed.segmented || phraseSegmented;

        const QStringList phraseTokens =
            TextNormalizer::tokenize(TextNormalizer::collapseWhitespace(phraseText));
        for (const QString& token : phraseTokens) {
            parsed.tokens.append(token);
        }
        appendUnique(phraseTerms, phraseTokens.join(QLatin1Char(' ')));
        remainder.replace(match.captured(0), QStringLiteral(" "));
    }

    bool remainderSegmented = false;
    const QString prepared = segmentIfThaiDense(remainder, &remainderSegmented);
    parsed.segmented = parsed.segmented || remainderSegmented;

    const QStringList tokens =
        TextNormalizer::tokenize(TextNormalizer::collapseWhitespace(prepared));
    QStringList filtered;
    for (const QString& token : tokens) {
        parsed.tokens.append(token);
        if (token.size() > 1 && !isStopWord(token)) {
            appendUnique(filtered, token);
        }
    }

    // A query made only of stop words still has to score against something.
    if (filtered.isEmpty() && phraseTerms.isEmpty()) {
        for (const QString& token : tokens) {
            appendUnique(filtered, token);
        }
    }

    parsed.terms = phraseTerms + filtered;

    LOG_DEBUG(drQuery, "Parsed query into %d tokens, %d terms (segmented=%d)",
              static_cast<int>(parsed.tokens.size()),
              static_cast<int>(parsed.terms.size()),
              parsed.segmented ? 1 : 0);
    return parsed;
}

} // namespace dr
