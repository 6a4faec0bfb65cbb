#pragma once

#include <QString>
#include <QStringList>

#include <cstdint>
#include <vector>

struct sqlite3;

namespace sift {

// Trigram word similarity in the manner of PostgreSQL pg_trgm.
//
// Each word is lowercased and padded ("  word ") before trigrams are taken.
// wordSimilarity(keyword, text) is the best
//   common / (|T(keyword)| + |T(extent)| - common)
// over every contiguous extent of the text's ordered trigram sequence, so a
// keyword scores 1.0 against text containing it as a whole word and degrades
// gracefully with typos or partial matches.
class TrigramProfile {
public:
    explicit TrigramProfile(const QString& text);

    const std::vector<uint64_t>& ordered() const { return m_ordered; }
    bool isEmpty() const { return m_ordered.empty(); }

    // Unique trigrams of the text, sorted.
    std::vector<uint64_t> uniqueSorted() const;

private:
    std::vector<uint64_t> m_ordered;
};

double wordSimilarity(const QString& keyword, const TrigramProfile& text);
double wordSimilarity(const QString& keyword, const QString& text);

// Average of wordSimilarity() over the keywords; 0 for no keywords.
double keywordScore(const QStringList& keywords, const QString& text);

// Registers sift_keyword_score(keywords TEXT, content TEXT) -> REAL on the
// connection. `keywords` is space-separated. Returns false on failure.
bool registerKeywordScoreFunction(sqlite3* db);

} // namespace sift
