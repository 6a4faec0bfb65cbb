#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace sift {

QString computeChunkId(const QString& documentId, int chunkIndex)
{
    const QString seed = documentId + QStringLiteral("#") + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

int estimateTokenCount(const QString& text)
{
    constexpr int kCharsPerToken = 4;
    const int length = static_cast<int>(text.size());
    return (length + kCharsPerToken - 1) / kCharsPerToken;
}

} // namespace sift
