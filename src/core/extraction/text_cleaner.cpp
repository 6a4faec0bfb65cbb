#include "core/extraction/text_cleaner.h"

namespace sift {

namespace {

bool isHorizontalSpace(QChar ch)
{
    return ch == QLatin1Char(' ') || ch == QLatin1Char('\t');
}

void chopTrailingSpace(QString& text)
{
    int end = text.size();
    while (end > 0 && isHorizontalSpace(text[end - 1])) {
        --end;
    }
    text.truncate(end);
}

} // namespace

QString TextCleaner::clean(const QString& raw)
{
    if (raw.isEmpty()) {
        return raw;
    }

    QString result;
    result.reserve(raw.size());

    int pendingNewlines = 0;
    int i = raw.startsWith(QChar(0xFEFF)) ? 1 : 0;
    for (; i < raw.size(); ++i) {
        const QChar ch = raw[i];
        const ushort code = ch.unicode();

        if (code == '\r' || code == '\n') {
            if (code == '\r' && i + 1 < raw.size() && raw[i + 1] == QLatin1Char('\n')) {
                ++i;
            }
            chopTrailingSpace(result);
            ++pendingNewlines;
            continue;
        }

        if ((code < 0x20 && code != '\t') || code == 0x7F) {
            continue;
        }

        if (pendingNewlines > 0) {
            if (!result.isEmpty()) {
                result.append(pendingNewlines >= 2 ? QStringLiteral("\n\n")
                                                   : QStringLiteral("\n"));
            }
            pendingNewlines = 0;
        }
        result.append(ch);
    }

    chopTrailingSpace(result);
    return result;
}

} // namespace sift
