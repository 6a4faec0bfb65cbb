#include "core/ranking/cross_encoder_reranker.h"

#include "core/ranking/onnx_pair_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace sift {

namespace {

double sigmoid(float logit)
{
    return 1.0 / (1.0 + std::exp(-static_cast<double>(logit)));
}

} // namespace

CrossEncoderReranker::CrossEncoderReranker(PairScorerFactory factory, RerankerConfig config)
    : m_factory(std::move(factory))
    , m_config(config)
{
    if (m_config.batchSize < 1) {
        m_config.batchSize = 1;
    }
}

CrossEncoderReranker::~CrossEncoderReranker() = default;

PairScorerFactory CrossEncoderReranker::onnxFactory(ModelRegistry* registry, std::string role)
{
    return [registry, role = std::move(role)]() {
        return OnnxPairScorer::create(registry, role);
    };
}

Status CrossEncoderReranker::ensureLoaded()
{
    std::call_once(m_loadOnce, [this]() {
        if (!m_factory) {
            m_loadStatus = makeError(ErrorKind::Unavailable,
                                     QStringLiteral("no reranker model configured"));
            return;
        }

        Result<std::unique_ptr<PairScorer>> created = m_factory();
        if (!created) {
            m_loadStatus = created.error();
            LOG_WARN(siftRanking, "Reranker load failed, reranking disabled: %s",
                     qUtf8Printable(created.error().message));
            return;
        }
        m_scorer = std::move(created).value();
        if (!m_scorer) {
            m_loadStatus = makeError(ErrorKind::Unavailable,
                                     QStringLiteral("reranker factory returned no scorer"));
            return;
        }
        LOG_INFO(siftRanking, "Reranker model loaded");
    });
    return m_loadStatus;
}

Result<std::vector<SearchResult>> CrossEncoderReranker::tryRerank(
    const QString& query, const std::vector<SearchResult>& candidates, std::optional<int> topK)
{
    if (candidates.empty()) {
        return candidates;
    }

    const Status loaded = ensureLoaded();
    if (!loaded) {
        return loaded.error();
    }

    std::vector<SearchResult> rescored = candidates;
    const size_t batchSize = static_cast<size_t>(m_config.batchSize);

    for (size_t start = 0; start < rescored.size(); start += batchSize) {
        const size_t end = std::min(rescored.size(), start + batchSize);

        std::vector<QString> passages;
        passages.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            passages.push_back(rescored[i].content);
        }

        Result<std::vector<float>> logits = m_scorer->scoreBatch(query, passages);
        if (!logits) {
            return logits.error();
        }
        if (logits.value().size() != passages.size()) {
            return makeError(ErrorKind::DataIntegrity,
                             QStringLiteral("reranker returned %1 scores for %2 passages")
                                 .arg(static_cast<int>(logits.value().size()))
                                 .arg(static_cast<int>(passages.size())));
        }
        for (size_t i = start; i < end; ++i) {
            rescored[i].similarity = sigmoid(logits.value()[i - start]);
        }
    }

    std::stable_sort(rescored.begin(), rescored.end(),
                     [](const SearchResult& a, const SearchResult& b) {
                         return a.similarity > b.similarity;
                     });

    if (topK && *topK >= 0 && static_cast<size_t>(*topK) < rescored.size()) {
        rescored.resize(static_cast<size_t>(*topK));
    }
    return rescored;
}

std::vector<SearchResult> CrossEncoderReranker::rerank(const QString& query,
                                                       const std::vector<SearchResult>& candidates,
                                                       std::optional<int> topK)
{
    Result<std::vector<SearchResult>> reranked = tryRerank(query, candidates, topK);
    if (!reranked) {
        LOG_WARN(siftRanking, "Reranking skipped, keeping input order: %s",
                 qUtf8Printable(reranked.error().toString()));
        return candidates;
    }
    return std::move(reranked).value();
}

} // namespace sift
