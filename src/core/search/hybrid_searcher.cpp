#include "core/search/hybrid_searcher.h"

#include "core/search/keyword_search.h"
#include "core/shared/logging.h"
#include "core/vector/search_merger.h"
#include "core/vector/vector_search.h"

#include <QElapsedTimer>

#include <future>

namespace sift {

HybridSearcher::HybridSearcher(VectorSearch* vectorSearch, KeywordSearch* keywordSearch,
                               HybridConfig config)
    : m_vectorSearch(vectorSearch)
    , m_keywordSearch(keywordSearch)
    , m_config(config)
{
    if (m_config.overFetchFactor < 1) {
        m_config.overFetchFactor = 1;
    }
}

Result<std::vector<SearchResult>> HybridSearcher::search(const QString& queryText,
                                                         const Embedding& queryVector,
                                                         int limit,
                                                         double vectorWeight,
                                                         double keywordWeight,
                                                         KeywordStrategy* strategyOut,
                                                         HybridTimings* timingsOut)
{
    if (strategyOut) {
        *strategyOut = KeywordStrategy::None;
    }
    if (limit < 1) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("hybrid search limit must be >= 1, got %1").arg(limit));
    }
    if (!m_vectorSearch || !m_keywordSearch) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("hybrid search not wired"));
    }

    QElapsedTimer timer;
    timer.start();

    const int fetchLimit = limit * m_config.overFetchFactor;
    HybridTimings timings;

    auto vectorFuture = std::async(std::launch::async, [&]() {
        QElapsedTimer channelTimer;
        channelTimer.start();
        auto results = m_vectorSearch->search(queryVector, fetchLimit, m_config.vectorThreshold);
        timings.vectorMs = static_cast<int>(channelTimer.elapsed());
        return results;
    });
    auto keywordFuture = std::async(std::launch::async, [&]() {
        QElapsedTimer channelTimer;
        channelTimer.start();
        auto results = m_keywordSearch->search(queryText, fetchLimit, m_config.keywordThreshold);
        timings.keywordMs = static_cast<int>(channelTimer.elapsed());
        return results;
    });

    Result<std::vector<SearchResult>> vectorResults = vectorFuture.get();
    Result<KeywordSearchResult> keywordResults = keywordFuture.get();

    std::vector<SearchResult> vectorList;
    std::vector<SearchResult> keywordList;

    if (vectorResults) {
        vectorList = std::move(vectorResults).value();
    } else if (m_config.allowDegraded && keywordResults) {
        LOG_WARN(siftSearch, "Hybrid search degraded to keyword only: %s",
                 qUtf8Printable(vectorResults.error().toString()));
    } else {
        return vectorResults.error();
    }

    if (keywordResults) {
        if (strategyOut) {
            *strategyOut = keywordResults.value().strategy;
        }
        keywordList = std::move(keywordResults.value().results);
    } else if (m_config.allowDegraded) {
        LOG_WARN(siftSearch, "Hybrid search degraded to vector only: %s",
                 qUtf8Printable(keywordResults.error().toString()));
    } else {
        return keywordResults.error();
    }

    FusionConfig fusion;
    fusion.rrfK = m_config.rrfK;
    fusion.weightA = vectorWeight;
    fusion.weightB = keywordWeight;

    timings.vectorCount = static_cast<int>(vectorList.size());
    timings.keywordCount = static_cast<int>(keywordList.size());
    if (timingsOut) {
        *timingsOut = timings;
    }

    std::vector<SearchResult> fused = SearchMerger::fuse(vectorList, keywordList, fusion);
    if (fused.size() > static_cast<size_t>(limit)) {
        fused.resize(static_cast<size_t>(limit));
    }

    LOG_DEBUG(siftSearch, "Hybrid search: %zu vector + %zu keyword -> %zu fused in %lld ms",
              vectorList.size(), keywordList.size(), fused.size(),
              static_cast<long long>(timer.elapsed()));
    return fused;
}

} // namespace sift
