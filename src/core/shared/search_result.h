#pragma once

#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace sift {

// One ranked passage. `similarity` belongs to the stage that produced it
// (cosine, fuzzy keyword score, RRF score or reranker score) and is replaced
// at every fusion or rerank step.
struct SearchResult {
    QString chunkId;
    QString documentId;
    QString content;
    double similarity = 0.0;
    Metadata metadata;
    QString documentTitle;
    QString documentSource;
};

// Which keyword strategy produced a keyword result list.
enum class KeywordStrategy {
    None,       // No usable keywords after preprocessing
    Fuzzy,      // Graded trigram word-similarity scores
    Substring,  // Degraded exact-substring match with a flat score
};

QString keywordStrategyToString(KeywordStrategy strategy);

// "[Source n: title]\ncontent" blocks, 1-indexed, separated by blank lines.
QString formatContext(const std::vector<SearchResult>& results);

QJsonObject searchResultToJson(const SearchResult& result);

} // namespace sift
