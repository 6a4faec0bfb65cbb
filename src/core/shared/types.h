#pragma once

#include "core/shared/result.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace sift {

// Metadata -- string-keyed map of scalar values (string, number, bool).
// The key set is open; the keys below carry fixed meaning and types and are
// checked by validateMetadata() wherever metadata enters the system.
using Metadata = QJsonObject;

namespace MetadataKeys {
inline const QString FilePath = QStringLiteral("file_path");          // string
inline const QString IngestionDate = QStringLiteral("ingestion_date"); // ISO-8601 string
inline const QString Heading = QStringLiteral("heading");             // string
inline const QString HeadingPath = QStringLiteral("heading_path");    // string, " > " separated
inline const QString ChunkMethod = QStringLiteral("chunk_method");    // "semantic" | "fixed"
inline const QString CharStart = QStringLiteral("char_start");        // integer
inline const QString CharEnd = QStringLiteral("char_end");            // integer
inline const QString Title = QStringLiteral("title");                 // string
inline const QString Source = QStringLiteral("source");               // string
} // namespace MetadataKeys

// Rejects nested values and known keys carrying the wrong type.
Status validateMetadata(const Metadata& metadata);

struct Document {
    QString id;
    QString title;
    QString source;
    QString fullText;
    Metadata metadata;
    QDateTime createdAt;
    QDateTime updatedAt;
};

// Generates a new opaque document identifier (UUID without braces).
QString newDocumentId();

} // namespace sift
