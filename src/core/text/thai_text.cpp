#include "core/text/thai_text.h"

namespace dr {
namespace thai {

namespace {

bool isToneMark(char16_t code)
{
    // MAITAIKHU, MAI EK, MAI THO, MAI TRI, MAI CHATTAWA, THANTHAKHAT
    return code >= 0x0E47 && code <= 0x0E4C;
}

bool isFoldedVowel(char16_t code)
{
    switch (code) {
    case 0x0E30: // SARA A
    case 0x0E32: // SARA AA
    case 0x0E34: // SARA I
    case 0x0E35: // SARA II
    case 0x0E36: // SARA UE
    case 0x0E37: // SARA UEE
    case 0x0E38: // SARA U
    case 0x0E39: // SARA UU
    case 0x0E40: // SARA E
    case 0x0E41: // SARA AE
    case 0x0E42: // SARA O
    case 0x0E43: // SARA AI MAIMUAN
    case 0x0E44: // SARA AI MAIMALAI
        return true;
    default:
        return false;
    }
}

} // namespace

bool isThaiChar(QChar ch)
{
    const char16_t code = ch.unicode();
    return code >= 0x0E00 && code <= 0x0E7F;
}

bool containsThai(const QString& text)
{
    for (const QChar ch : text) {
        if (isThaiChar(ch)) {
            return true;
        }
    }
    return false;
}

double density(const QString& text)
{
    if (text.isEmpty()) {
        return 0.0;
    }
    int thaiCount = 0;
    for (const QChar ch : text) {
        if (isThaiChar(ch)) {
            ++thaiCount;
        }
    }
    return static_cast<double>(thaiCount) / static_cast<double>(text.size());
}

bool isDense(const QString& text, double threshold)
{
    return density(text) > threshold;
}

QString fold(const QString& text)
{
    QString folded;
    folded.reserve(text.size());
    for (const QChar ch : text) {
        const char16_t code = ch.unicode();
        if (isToneMark(code) || isFoldedVowel(code)) {
            continue;
        }
        folded.append(ch.toLower());
    }
    return folded;
}

QString foldCompact(const QString& text)
{
    QString compact;
    const QString folded = fold(text);
    compact.reserve(folded.size());
    for (const QChar ch : folded) {
        if (!ch.isSpace()) {
            compact.append(ch);
        }
    }
    return compact;
}

} // namespace thai
} // namespace dr
