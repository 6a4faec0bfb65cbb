#pragma once

#include "core/shared/chunk.h"
#include "core/shared/result.h"
#include "core/shared/search_result.h"

#include <vector>

namespace sift {

class SQLiteStore;
class VectorIndex;

// VectorSearch: nearest chunks to a query vector, hydrated from the store.
// similarity = 1 - cosine distance; results under the threshold are dropped
// before `limit` is applied.
class VectorSearch {
public:
    VectorSearch(SQLiteStore* store, VectorIndex* index);

    Result<std::vector<SearchResult>> search(const Embedding& queryVector,
                                             int limit,
                                             double similarityThreshold) const;

private:
    SQLiteStore* m_store = nullptr;
    VectorIndex* m_index = nullptr;
};

} // namespace sift
