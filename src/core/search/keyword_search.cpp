#include "core/search/keyword_search.h"

#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

namespace sift {

const QSet<QString>& KeywordSearch::stopWords()
{
    static const QSet<QString> stopwords = {
        QStringLiteral("about"), QStringLiteral("above"), QStringLiteral("after"),
        QStringLiteral("again"), QStringLiteral("all"), QStringLiteral("also"),
        QStringLiteral("and"), QStringLiteral("any"), QStringLiteral("are"),
        QStringLiteral("because"), QStringLiteral("been"), QStringLiteral("before"),
        QStringLiteral("being"), QStringLiteral("between"), QStringLiteral("both"),
        QStringLiteral("but"), QStringLiteral("can"), QStringLiteral("could"),
        QStringLiteral("did"), QStringLiteral("does"), QStringLiteral("doing"),
        QStringLiteral("down"), QStringLiteral("during"), QStringLiteral("each"),
        QStringLiteral("few"), QStringLiteral("for"), QStringLiteral("from"),
        QStringLiteral("further"), QStringLiteral("had"), QStringLiteral("has"),
        QStringLiteral("have"), QStringLiteral("having"), QStringLiteral("her"),
        QStringLiteral("here"), QStringLiteral("hers"), QStringLiteral("him"),
        QStringLiteral("his"), QStringLiteral("how"), QStringLiteral("into"),
        QStringLiteral("its"), QStringLiteral("itself"), QStringLiteral("just"),
        QStringLiteral("more"), QStringLiteral("most"), QStringLiteral("not"),
        QStringLiteral("now"), QStringLiteral("off"), QStringLiteral("once"),
        QStringLiteral("only"), QStringLiteral("other"), QStringLiteral("our"),
        QStringLiteral("ours"), QStringLiteral("out"), QStringLiteral("over"),
        QStringLiteral("own"), QStringLiteral("same"), QStringLiteral("she"),
        QStringLiteral("should"), QStringLiteral("some"), QStringLiteral("such"),
        QStringLiteral("than"), QStringLiteral("that"), QStringLiteral("the"),
        QStringLiteral("their"), QStringLiteral("theirs"), QStringLiteral("them"),
        QStringLiteral("then"), QStringLiteral("there"), QStringLiteral("these"),
        QStringLiteral("they"), QStringLiteral("this"), QStringLiteral("those"),
        QStringLiteral("through"), QStringLiteral("too"), QStringLiteral("under"),
        QStringLiteral("until"), QStringLiteral("very"), QStringLiteral("was"),
        QStringLiteral("were"), QStringLiteral("what"), QStringLiteral("when"),
        QStringLiteral("where"), QStringLiteral("which"), QStringLiteral("while"),
        QStringLiteral("who"), QStringLiteral("whom"), QStringLiteral("why"),
        QStringLiteral("will"), QStringLiteral("with"), QStringLiteral("would"),
        QStringLiteral("you"), QStringLiteral("your"), QStringLiteral("yours"),
    };
    return stopwords;
}

KeywordSearch::KeywordSearch(SQLiteStore* store)
    : m_store(store)
{
}

QStringList KeywordSearch::extractKeywords(const QString& queryText)
{
    QString cleaned;
    cleaned.reserve(queryText.size());
    for (const QChar ch : queryText.toLower()) {
        // Punctuation and symbols split words; "e-mail" becomes "e" + "mail".
        cleaned.append(ch.isLetterOrNumber() ? ch : QChar(' '));
    }

    QStringList keywords;
    const QSet<QString>& stopwords = stopWords();
    for (const QString& token : cleaned.split(QChar(' '), Qt::SkipEmptyParts)) {
        if (token.size() >= kMinKeywordLength && !stopwords.contains(token)
            && !keywords.contains(token)) {
            keywords.append(token);
        }
    }
    return keywords;
}

Result<KeywordSearchResult> KeywordSearch::search(const QString& queryText,
                                                  int limit,
                                                  double threshold)
{
    if (limit < 1) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("keyword search limit must be >= 1, got %1").arg(limit));
    }
    if (!m_store) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("no store for keyword search"));
    }

    KeywordSearchResult out;
    const QStringList keywords = extractKeywords(queryText);
    if (keywords.isEmpty()) {
        LOG_DEBUG(siftSearch, "Keyword search: no keywords left in '%s'",
                  qUtf8Printable(queryText));
        return out;
    }

    QString fallbackReason;
    if (m_store->fuzzyMatcherAvailable()) {
        auto fuzzy = m_store->fuzzyKeywordSearch(keywords, threshold, limit);
        if (fuzzy) {
            out.results = std::move(fuzzy).value();
            out.strategy = KeywordStrategy::Fuzzy;
            return out;
        }
        fallbackReason = fuzzy.error().toString();
    } else {
        fallbackReason = QStringLiteral("fuzzy matcher not registered");
    }

    LOG_WARN(siftSearch, "Fuzzy keyword search unavailable (%s), using substring match",
             qUtf8Printable(fallbackReason));

    auto substring = m_store->substringKeywordSearch(
        keywords.mid(0, kSubstringKeywordLimit), limit, kSubstringScore);
    if (!substring) {
        return substring.error();
    }
    out.results = std::move(substring).value();
    out.strategy = KeywordStrategy::Substring;
    return out;
}

} // namespace sift
