#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace dr {

QString computeChunkId(int64_t documentId, int chunkIndex)
{
    const QString seed = QString::number(documentId) + QStringLiteral("#")
                         + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

} // namespace dr
