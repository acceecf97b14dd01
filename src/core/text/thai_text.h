#pragma once

#include <QChar>
#include <QString>

namespace dr {

// Helpers for Thai script (U+0E00..U+0E7F), which does not delimit words
// with whitespace.
namespace thai {

constexpr double kSegmentationDensityThreshold = 0.10;

bool isThaiChar(QChar ch);
bool containsThai(const QString& text);

// Fraction of characters in the Thai block, over all characters.
double density(const QString& text);

// True when more than `threshold` of the characters are Thai.
bool isDense(const QString& text, double threshold = kSegmentationDensityThreshold);

// Lowercase and drop tone marks and the common vowel signs, so spelling
// variants of the same word compare equal.
QString fold(const QString& text);

// fold() with all whitespace removed.
QString foldCompact(const QString& text);

} // namespace thai
} // namespace dr
