#include "core/shared/result.h"

namespace sift {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Validation:    return QStringLiteral("validation");
    case ErrorKind::Connectivity:  return QStringLiteral("connectivity");
    case ErrorKind::PartialItem:   return QStringLiteral("partial_item");
    case ErrorKind::DataIntegrity: return QStringLiteral("data_integrity");
    case ErrorKind::Storage:       return QStringLiteral("storage");
    case ErrorKind::Unavailable:   return QStringLiteral("unavailable");
    }
    return QStringLiteral("unknown");
}

QString Error::toString() const
{
    return QStringLiteral("%1: %2").arg(errorKindToString(kind), message);
}

} // namespace sift
