#pragma once

#include <QString>

namespace sift {

// TextCleaner: normalizes extracted text before chunking.
//
// 1. Drops a leading byte-order mark
// 2. \r\n and \r become \n
// 3. Control characters other than tab and newline are removed
// 4. Trailing spaces/tabs are cut from every line, so blank lines are empty
// 5. Runs of 3+ newlines become one blank line
// Leading indentation is kept; markdown code blocks depend on it.
class TextCleaner {
public:
    static QString clean(const QString& raw);
};

} // namespace sift
