#pragma once

#include "core/shared/chunk.h"
#include "core/shared/result.h"
#include "core/shared/search_result.h"

#include <QString>

#include <vector>

namespace sift {

class KeywordSearch;
class VectorSearch;

struct HybridConfig {
    double vectorThreshold = 0.3;
    double keywordThreshold = 0.3;
    int rrfK = 60;
    int overFetchFactor = 3;     // Each channel fetches overFetchFactor * limit
    // When true, a failed channel is logged and the other channel's results
    // are fused alone. Otherwise the failure is returned.
    bool allowDegraded = false;
};

// Wall time of each channel; both run concurrently.
struct HybridTimings {
    int vectorMs = 0;
    int keywordMs = 0;
    int vectorCount = 0;
    int keywordCount = 0;
};

// HybridSearcher: runs vector and keyword retrieval concurrently and merges
// them with weighted Reciprocal Rank Fusion.
class HybridSearcher {
public:
    HybridSearcher(VectorSearch* vectorSearch, KeywordSearch* keywordSearch,
                   HybridConfig config = {});

    HybridSearcher(const HybridSearcher&) = delete;
    HybridSearcher& operator=(const HybridSearcher&) = delete;

    // Fused results, at most `limit`. The keyword strategy that actually ran
    // is written to *strategyOut when given, channel timings to *timingsOut.
    Result<std::vector<SearchResult>> search(const QString& queryText,
                                             const Embedding& queryVector,
                                             int limit,
                                             double vectorWeight = 0.6,
                                             double keywordWeight = 0.4,
                                             KeywordStrategy* strategyOut = nullptr,
                                             HybridTimings* timingsOut = nullptr);

    const HybridConfig& config() const { return m_config; }

private:
    VectorSearch* m_vectorSearch = nullptr;
    KeywordSearch* m_keywordSearch = nullptr;
    HybridConfig m_config;
};

} // namespace sift
