#include "core/vector/vector_search.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <cmath>

namespace sift {

VectorSearch::VectorSearch(SQLiteStore* store, VectorIndex* index)
    : m_store(store)
    , m_index(index)
{
}

Result<std::vector<SearchResult>> VectorSearch::search(const Embedding& queryVector,
                                                       int limit,
                                                       double similarityThreshold) const
{
    if (limit < 1) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("vector search limit must be at least 1, got %1").arg(limit));
    }
    if (!m_store || !m_index || !m_index->isAvailable()) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("vector index is not available"));
    }
    if (static_cast<int>(queryVector.size()) != m_index->dimensions()) {
        return makeError(ErrorKind::DataIntegrity,
                         QStringLiteral("query vector has %1 dimensions, expected %2")
                             .arg(static_cast<int>(queryVector.size()))
                             .arg(m_index->dimensions()));
    }
    for (float v : queryVector) {
        if (!std::isfinite(v)) {
            return makeError(ErrorKind::DataIntegrity,
                             QStringLiteral("query vector contains a non-finite value"));
        }
    }

    const auto hits = m_index->search(queryVector, limit);

    std::vector<int64_t> rowIds;
    std::vector<double> similarities;
    rowIds.reserve(hits.size());
    similarities.reserve(hits.size());
    for (const auto& hit : hits) {
        const double similarity = 1.0 - static_cast<double>(hit.distance);
        if (similarity < similarityThreshold) {
            continue;
        }
        rowIds.push_back(static_cast<int64_t>(hit.label));
        similarities.push_back(similarity);
    }

    auto hydrated = m_store->hydrateChunks(rowIds);
    if (!hydrated) {
        return hydrated.error();
    }

    std::vector<SearchResult> results;
    results.reserve(rowIds.size());
    for (size_t i = 0; i < rowIds.size(); ++i) {
        auto it = hydrated.value().find(rowIds[i]);
        if (it == hydrated.value().end()) {
            // Deleted between the index lookup and hydration.
            continue;
        }
        SearchResult result = std::move(it->second);
        result.similarity = similarities[i];
        results.push_back(std::move(result));
    }

    LOG_DEBUG(siftSearch, "Vector search: %d hits, %d above threshold %.3f",
              static_cast<int>(hits.size()), static_cast<int>(results.size()),
              similarityThreshold);
    return results;
}

} // namespace sift
