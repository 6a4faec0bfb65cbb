#include "core/index/trigram_similarity.h"

#include <sqlite3.h>

#include <algorithm>
#include <unordered_set>

namespace sift {

namespace {

// Bound on extent length relative to the keyword's trigram count; longer
// extents only add unmatched trigrams and can never score higher.
constexpr size_t kExtentSlack = 2;

uint64_t packTrigram(QChar a, QChar b, QChar c)
{
    return (static_cast<uint64_t>(a.unicode()) << 32)
         | (static_cast<uint64_t>(b.unicode()) << 16)
         | static_cast<uint64_t>(c.unicode());
}

void appendWordTrigrams(const QString& word, std::vector<uint64_t>* out)
{
    const QString padded = QStringLiteral("  ") + word + QLatin1Char(' ');
    for (int i = 0; i + 2 < padded.size(); ++i) {
        out->push_back(packTrigram(padded[i], padded[i + 1], padded[i + 2]));
    }
}

QStringList splitWords(const QString& text)
{
    QStringList words;
    QString current;
    for (const QChar ch : text) {
        if (ch.isLetterOrNumber()) {
            current.append(ch.toLower());
        } else if (!current.isEmpty()) {
            words.append(current);
            current.clear();
        }
    }
    if (!current.isEmpty()) {
        words.append(current);
    }
    return words;
}

void keywordScoreSql(sqlite3_context* ctx, int argc, sqlite3_value** argv)
{
    if (argc != 2
        || sqlite3_value_type(argv[0]) == SQLITE_NULL
        || sqlite3_value_type(argv[1]) == SQLITE_NULL) {
        sqlite3_result_double(ctx, 0.0);
        return;
    }

    const auto* keywordsText = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    const auto* contentText = reinterpret_cast<const char*>(sqlite3_value_text(argv[1]));
    const QStringList keywords = QString::fromUtf8(keywordsText)
                                     .split(QLatin1Char(' '), Qt::SkipEmptyParts);
    sqlite3_result_double(ctx, keywordScore(keywords, QString::fromUtf8(contentText)));
}

} // namespace

TrigramProfile::TrigramProfile(const QString& text)
{
    for (const QString& word : splitWords(text)) {
        appendWordTrigrams(word, &m_ordered);
    }
}

std::vector<uint64_t> TrigramProfile::uniqueSorted() const
{
    std::vector<uint64_t> unique = m_ordered;
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
    return unique;
}

double wordSimilarity(const QString& keyword, const TrigramProfile& text)
{
    const std::vector<uint64_t> keywordTrigrams = TrigramProfile(keyword).uniqueSorted();
    if (keywordTrigrams.empty() || text.isEmpty()) {
        return 0.0;
    }

    auto inKeyword = [&keywordTrigrams](uint64_t trigram) {
        return std::binary_search(keywordTrigrams.begin(), keywordTrigrams.end(), trigram);
    };

    const std::vector<uint64_t>& ordered = text.ordered();
    const size_t keywordCount = keywordTrigrams.size();
    const size_t maxExtent = keywordCount * kExtentSlack;
    double best = 0.0;

    for (size_t start = 0; start < ordered.size(); ++start) {
        // An optimal extent starts on a shared trigram.
        if (!inKeyword(ordered[start])) {
            continue;
        }

        std::unordered_set<uint64_t> seen;
        size_t common = 0;
        const size_t end = std::min(ordered.size(), start + maxExtent);
        for (size_t i = start; i < end; ++i) {
            const uint64_t trigram = ordered[i];
            if (!seen.insert(trigram).second) {
                continue;
            }
            if (inKeyword(trigram)) {
                ++common;
            }
            const double score = static_cast<double>(common)
                / static_cast<double>(keywordCount + seen.size() - common);
            best = std::max(best, score);
        }

        if (best >= 1.0) {
            break;
        }
    }

    return best;
}

double wordSimilarity(const QString& keyword, const QString& text)
{
    return wordSimilarity(keyword, TrigramProfile(text));
}

double keywordScore(const QStringList& keywords, const QString& text)
{
    if (keywords.isEmpty()) {
        return 0.0;
    }
    const TrigramProfile profile(text);
    double total = 0.0;
    for (const QString& keyword : keywords) {
        total += wordSimilarity(keyword, profile);
    }
    return total / static_cast<double>(keywords.size());
}

bool registerKeywordScoreFunction(sqlite3* db)
{
    if (db == nullptr) {
        return false;
    }
    const int rc = sqlite3_create_function_v2(db,
                                              "sift_keyword_score",
                                              2,
                                              SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                              nullptr,
                                              &keywordScoreSql,
                                              nullptr,
                                              nullptr,
                                              nullptr);
    return rc == SQLITE_OK;
}

} // namespace sift
