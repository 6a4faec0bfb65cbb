#include "core/shared/types.h"

#include <QUuid>

namespace sift {

namespace {

bool isIntegral(const QJsonValue& value)
{
    if (!value.isDouble()) {
        return false;
    }
    const double d = value.toDouble();
    return d == static_cast<double>(static_cast<qint64>(d));
}

} // namespace

Status validateMetadata(const Metadata& metadata)
{
    static const QString kStringKeys[] = {
        MetadataKeys::FilePath,
        MetadataKeys::IngestionDate,
        MetadataKeys::Heading,
        MetadataKeys::HeadingPath,
        MetadataKeys::ChunkMethod,
        MetadataKeys::Title,
        MetadataKeys::Source,
    };

    for (auto it = metadata.constBegin(); it != metadata.constEnd(); ++it) {
        if (it.value().isObject() || it.value().isArray()) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("metadata key '%1' must hold a scalar value")
                                 .arg(it.key()));
        }
    }

    for (const QString& key : kStringKeys) {
        if (metadata.contains(key) && !metadata.value(key).isString()) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("metadata key '%1' must be a string").arg(key));
        }
    }

    for (const QString& key : {MetadataKeys::CharStart, MetadataKeys::CharEnd}) {
        if (metadata.contains(key) && !isIntegral(metadata.value(key))) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("metadata key '%1' must be an integer").arg(key));
        }
    }

    if (metadata.contains(MetadataKeys::ChunkMethod)) {
        const QString method = metadata.value(MetadataKeys::ChunkMethod).toString();
        if (method != QLatin1String("semantic") && method != QLatin1String("fixed")) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("unknown chunk_method '%1'").arg(method));
        }
    }

    if (metadata.contains(MetadataKeys::IngestionDate)) {
        const QDateTime parsed = QDateTime::fromString(
            metadata.value(MetadataKeys::IngestionDate).toString(), Qt::ISODate);
        if (!parsed.isValid()) {
            return makeError(ErrorKind::Validation,
                             QStringLiteral("ingestion_date is not ISO-8601"));
        }
    }

    return Status::success();
}

QString newDocumentId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

} // namespace sift
