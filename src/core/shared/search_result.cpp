#include "core/shared/search_result.h"

#include <QStringList>

namespace sift {

QString keywordStrategyToString(KeywordStrategy strategy)
{
    switch (strategy) {
    case KeywordStrategy::None:      return QStringLiteral("none");
    case KeywordStrategy::Fuzzy:     return QStringLiteral("fuzzy");
    case KeywordStrategy::Substring: return QStringLiteral("substring");
    }
    return QStringLiteral("none");
}

QString formatContext(const std::vector<SearchResult>& results)
{
    QStringList parts;
    parts.reserve(static_cast<qsizetype>(results.size()));
    int sourceNumber = 1;
    for (const SearchResult& result : results) {
        parts.append(QStringLiteral("[Source %1: %2]\n%3")
                         .arg(QString::number(sourceNumber),
                              result.documentTitle,
                              result.content));
        ++sourceNumber;
    }
    return parts.join(QStringLiteral("\n\n"));
}

QJsonObject searchResultToJson(const SearchResult& result)
{
    QJsonObject json;
    json.insert(QStringLiteral("chunk_id"), result.chunkId);
    json.insert(QStringLiteral("document_id"), result.documentId);
    json.insert(QStringLiteral("content"), result.content);
    json.insert(QStringLiteral("similarity"), result.similarity);
    json.insert(QStringLiteral("metadata"), result.metadata);
    json.insert(QStringLiteral("document_title"), result.documentTitle);
    json.insert(QStringLiteral("document_source"), result.documentSource);
    return json;
}

} // namespace sift
