#pragma once

#include "core/shared/result.h"
#include "core/shared/search_result.h"

#include <QJsonObject>
#include <QString>

#include <vector>

namespace sift {

class CrossEncoderReranker;
class Embedder;
class HybridSearcher;
class VectorSearch;

enum class SearchMode {
    Hybrid,
    Vector,
};

struct RetrievalConfig {
    double similarityThreshold = 0.3;
    double vectorWeight = 0.6;
    double keywordWeight = 0.4;
    int rerankerTopK = 30;     // Candidates handed to the reranker
};

struct SearchRequest {
    int limit = 5;
    SearchMode mode = SearchMode::Hybrid;
    bool rerank = true;
};

// Per-stage timings of one search. Channel times overlap in Hybrid mode.
struct SearchStats {
    int embedMs = 0;
    int vectorMs = 0;
    int keywordMs = 0;             // 0 in Vector mode
    int fusedCount = 0;            // Candidates after retrieval, before rerank
    int rerankMs = 0;
    int rerankTopMovedFrom = -1;   // Candidate position of the reranked top result, -1 when not reranked
};

QJsonObject searchStatsToJson(const SearchStats& stats);

struct SearchResponse {
    std::vector<SearchResult> results;
    KeywordStrategy keywordStrategy = KeywordStrategy::None;
    bool reranked = false;
    SearchStats stats;
};

// RetrievalEngine: query entry point: validate, embed, retrieve, rerank.
// Does not own its collaborators. hybrid and reranker may be null, which
// makes Hybrid mode a Validation error and turns reranking off.
class RetrievalEngine {
public:
    static constexpr int kMaxQueryLength = 2000;
    static constexpr int kMaxLimit = 100;

    RetrievalEngine(Embedder* embedder,
                    VectorSearch* vectorSearch,
                    HybridSearcher* hybrid,
                    CrossEncoderReranker* reranker,
                    RetrievalConfig config = {});

    RetrievalEngine(const RetrievalEngine&) = delete;
    RetrievalEngine& operator=(const RetrievalEngine&) = delete;

    Result<SearchResponse> search(const QString& query, const SearchRequest& request);

    // Ranked context for an answer generator. No hits gives noResultsContext().
    Result<QString> buildContext(const QString& query, const SearchRequest& request);

    static const QString& noResultsContext();

    // Checks a request without touching any service.
    static Status validate(const QString& query, const SearchRequest& request);

private:
    Embedder* m_embedder = nullptr;
    VectorSearch* m_vectorSearch = nullptr;
    HybridSearcher* m_hybrid = nullptr;
    CrossEncoderReranker* m_reranker = nullptr;
    RetrievalConfig m_config;
};

} // namespace sift
