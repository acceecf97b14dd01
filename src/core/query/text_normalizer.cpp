#include "core/query/text_normalizer.h"

namespace dr {

bool TextNormalizer::isTokenSeparator(QChar ch)
{
    if (ch.isSpace()) {
        return true;
    }

    switch (ch.unicode()) {
    case '-':
    case '_':
    case ',':
    case '.':
    case '!':
    case '?':
    case '(':
    case ')':
    case '[':
    case ']':
    case '/':
    case '\\':
    case ':':
    case ';':
    case '"':
    case '\'':
        return true;
    default:
        return false;
    }
}

QString TextNormalizer::collapseWhitespace(const QString& text)
{
    QString collapsed;
    collapsed.reserve(text.size());

    for (const QChar ch : text) {
        if (ch.isSpace()) {
            if (collapsed.isEmpty() || collapsed.back() == QLatin1Char(' ')) {
                continue;
            }
            collapsed.append(QLatin1Char(' '));
            continue;
        }
        collapsed.append(ch);
    }

    if (!collapsed.isEmpty() && collapsed.back() == QLatin1Char(' ')) {
        collapsed.chop(1);
    }
    return collapsed;
}

QStringList TextNormalizer::tokenize(const QString& text)
{
    QStringList tokens;
    QString current;

    for (const QChar ch : text) {
        if (isTokenSeparator(ch)) {
            if (!current.isEmpty()) {
                tokens.append(current);
                current.clear();
            }
            continue;
        }
        current.append(ch.toLower());
    }

    if (!current.isEmpty()) {
        tokens.append(current);
    }
    return tokens;
}

} // namespace dr
