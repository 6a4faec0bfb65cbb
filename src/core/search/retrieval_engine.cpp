#include "core/search/retrieval_engine.h"

#include "core/embedding/embedder.h"
#include "core/ranking/cross_encoder_reranker.h"
#include "core/search/hybrid_searcher.h"
#include "core/shared/logging.h"
#include "core/vector/vector_search.h"

#include <QElapsedTimer>

#include <algorithm>

namespace sift {

RetrievalEngine::RetrievalEngine(Embedder* embedder,
                                 VectorSearch* vectorSearch,
                                 HybridSearcher* hybrid,
                                 CrossEncoderReranker* reranker,
                                 RetrievalConfig config)
    : m_embedder(embedder)
    , m_vectorSearch(vectorSearch)
    , m_hybrid(hybrid)
    , m_reranker(reranker)
    , m_config(config)
{
}

QJsonObject searchStatsToJson(const SearchStats& stats)
{
    QJsonObject json;
    json[QStringLiteral("embed_ms")] = stats.embedMs;
    json[QStringLiteral("vector_ms")] = stats.vectorMs;
    json[QStringLiteral("keyword_ms")] = stats.keywordMs;
    json[QStringLiteral("fused_count")] = stats.fusedCount;
    json[QStringLiteral("rerank_ms")] = stats.rerankMs;
    json[QStringLiteral("rerank_top_moved_from")] = stats.rerankTopMovedFrom;
    return json;
}

const QString& RetrievalEngine::noResultsContext()
{
    static const QString text =
        QStringLiteral("No relevant information found in the knowledge base.");
    return text;
}

Status RetrievalEngine::validate(const QString& query, const SearchRequest& request)
{
    const QString trimmed = query.trimmed();
    if (trimmed.isEmpty()) {
        return makeError(ErrorKind::Validation, QStringLiteral("query must not be empty"));
    }
    if (trimmed.size() > kMaxQueryLength) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("query exceeds %1 characters").arg(kMaxQueryLength));
    }
    if (request.limit < 1 || request.limit > kMaxLimit) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("limit must be between 1 and %1, got %2")
                             .arg(kMaxLimit)
                             .arg(request.limit));
    }
    return Status::success();
}

Result<SearchResponse> RetrievalEngine::search(const QString& query, const SearchRequest& request)
{
    const Status valid = validate(query, request);
    if (!valid) {
        return valid.error();
    }
    if (!m_embedder || !m_vectorSearch) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("retrieval engine not wired"));
    }
    if (request.mode == SearchMode::Hybrid && !m_hybrid) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("hybrid search is disabled in this configuration"));
    }

    const QString trimmed = query.trimmed();
    SearchResponse response;
    QElapsedTimer stageTimer;

    stageTimer.start();
    Result<Embedding> queryVector = m_embedder->embedQuery(trimmed);
    if (!queryVector) {
        return queryVector.error();
    }
    response.stats.embedMs = static_cast<int>(stageTimer.elapsed());

    const bool rerank = request.rerank && m_reranker != nullptr;
    const int fetchLimit = rerank ? std::max(request.limit, m_config.rerankerTopK)
                                  : request.limit;

    Result<std::vector<SearchResult>> candidates = std::vector<SearchResult>{};
    if (request.mode == SearchMode::Hybrid) {
        HybridTimings timings;
        candidates = m_hybrid->search(trimmed, queryVector.value(), fetchLimit,
                                      m_config.vectorWeight, m_config.keywordWeight,
                                      &response.keywordStrategy, &timings);
        response.stats.vectorMs = timings.vectorMs;
        response.stats.keywordMs = timings.keywordMs;
    } else {
        stageTimer.restart();
        candidates = m_vectorSearch->search(queryVector.value(), fetchLimit,
                                            m_config.similarityThreshold);
        response.stats.vectorMs = static_cast<int>(stageTimer.elapsed());
    }
    if (!candidates) {
        return candidates.error();
    }
    response.stats.fusedCount = static_cast<int>(candidates.value().size());

    if (rerank && !candidates.value().empty()) {
        // Reranking is best effort; the fallback decision is made here.
        stageTimer.restart();
        auto reranked = m_reranker->tryRerank(trimmed, candidates.value(), request.limit);
        response.stats.rerankMs = static_cast<int>(stageTimer.elapsed());
        if (reranked) {
            response.results = std::move(reranked).value();
            response.reranked = true;
            if (!response.results.empty()) {
                const QString& topId = response.results.front().chunkId;
                const auto& before = candidates.value();
                auto it = std::find_if(before.begin(), before.end(),
                                       [&](const SearchResult& r) { return r.chunkId == topId; });
                if (it != before.end()) {
                    response.stats.rerankTopMovedFrom = static_cast<int>(it - before.begin());
                }
            }
        } else {
            LOG_WARN(siftSearch, "Reranker failed, keeping retrieval order: %s",
                     qUtf8Printable(reranked.error().toString()));
            response.results = std::move(candidates).value();
        }
    } else {
        response.results = std::move(candidates).value();
    }

    if (response.results.size() > static_cast<size_t>(request.limit)) {
        response.results.resize(static_cast<size_t>(request.limit));
    }

    const SearchStats& stats = response.stats;
    LOG_INFO(siftSearch,
             "Search '%s': %zu result(s), keyword=%s, reranked=%s "
             "(embed %d ms, vector %d ms, keyword %d ms, %d fused, rerank %d ms)",
             qUtf8Printable(trimmed.left(80)), response.results.size(),
             qUtf8Printable(keywordStrategyToString(response.keywordStrategy)),
             response.reranked ? "yes" : "no",
             stats.embedMs, stats.vectorMs, stats.keywordMs, stats.fusedCount, stats.rerankMs);
    return response;
}

Result<QString> RetrievalEngine::buildContext(const QString& query, const SearchRequest& request)
{
    Result<SearchResponse> response = search(query, request);
    if (!response) {
        return response.error();
    }
    if (response.value().results.empty()) {
        return noResultsContext();
    }
    return formatContext(response.value().results);
}

} // namespace sift
