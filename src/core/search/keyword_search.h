#pragma once

#include "core/shared/result.h"
#include "core/shared/search_result.h"

#include <QSet>
#include <QString>
#include <QStringList>

#include <vector>

namespace sift {

class SQLiteStore;

struct KeywordSearchResult {
    std::vector<SearchResult> results;
    KeywordStrategy strategy = KeywordStrategy::None;
};

// KeywordSearch: lexical channel of hybrid retrieval.
//
// Graded trigram matching runs in SQLite through sift_keyword_score(). When
// that function is missing or its query fails, a substring LIKE over the
// first kSubstringKeywordLimit keywords takes over with a flat score; the
// returned strategy says which one ran.
class KeywordSearch {
public:
    static constexpr double kSubstringScore = 0.5;
    static constexpr int kSubstringKeywordLimit = 3;
    static constexpr int kMinKeywordLength = 3;

    explicit KeywordSearch(SQLiteStore* store);

    KeywordSearch(const KeywordSearch&) = delete;
    KeywordSearch& operator=(const KeywordSearch&) = delete;

    Result<KeywordSearchResult> search(const QString& queryText, int limit, double threshold);

    // Lowercase, strip punctuation, drop short tokens and stop words.
    // Duplicates keep their first position.
    static QStringList extractKeywords(const QString& queryText);

    static const QSet<QString>& stopWords();

private:
    SQLiteStore* m_store = nullptr;
};

} // namespace sift
