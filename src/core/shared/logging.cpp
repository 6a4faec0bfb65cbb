#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(siftCore, "sift.core")
Q_LOGGING_CATEGORY(siftIndex, "sift.index")
Q_LOGGING_CATEGORY(siftEmbed, "sift.embed")
Q_LOGGING_CATEGORY(siftSearch, "sift.search")
Q_LOGGING_CATEGORY(siftRanking, "sift.ranking")
Q_LOGGING_CATEGORY(siftIngest, "sift.ingest")

namespace sift {

bool applyLogLevel(const QString& level)
{
    const QString normalized = level.trimmed().toLower();
    QString rules;
    if (normalized == QLatin1String("debug")) {
        rules = QStringLiteral("sift.*.debug=true");
    } else if (normalized == QLatin1String("info")) {
        rules = QStringLiteral("sift.*.debug=false\nsift.*.info=true");
    } else if (normalized == QLatin1String("warning") || normalized == QLatin1String("warn")) {
        rules = QStringLiteral("sift.*.debug=false\nsift.*.info=false\nsift.*.warning=true");
    } else if (normalized == QLatin1String("error")) {
        rules = QStringLiteral("sift.*.debug=false\nsift.*.info=false\nsift.*.warning=false");
    } else {
        return false;
    }

    QLoggingCategory::setFilterRules(rules);
    return true;
}

} // namespace sift
