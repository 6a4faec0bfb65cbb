#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(siftCore)
Q_DECLARE_LOGGING_CATEGORY(siftIndex)
Q_DECLARE_LOGGING_CATEGORY(siftEmbed)
Q_DECLARE_LOGGING_CATEGORY(siftSearch)
Q_DECLARE_LOGGING_CATEGORY(siftRanking)
Q_DECLARE_LOGGING_CATEGORY(siftIngest)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)

namespace sift {

// Applies a minimum level ("debug", "info", "warning", "error") to every
// sift.* category. Unknown values leave the Qt defaults untouched.
bool applyLogLevel(const QString& level);

} // namespace sift
