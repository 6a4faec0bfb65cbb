#pragma once

#include "core/ranking/pair_scorer.h"
#include "core/shared/result.h"
#include "core/shared/search_result.h"

#include <QString>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class ModelRegistry;

struct RerankerConfig {
    int batchSize = 32;   // Pairs per inference call
};

// CrossEncoderReranker: rescores candidates with a (query, passage) model.
//
// The scorer is built on first use through the factory, exactly once per
// instance; concurrent first callers wait for that attempt. A failed load is
// remembered and never retried. Scores are sigmoid(logit) per pair.
class CrossEncoderReranker {
public:
    explicit CrossEncoderReranker(PairScorerFactory factory, RerankerConfig config = {});
    ~CrossEncoderReranker();

    CrossEncoderReranker(const CrossEncoderReranker&) = delete;
    CrossEncoderReranker& operator=(const CrossEncoderReranker&) = delete;

    // Factory for the ONNX scorer behind `registry` (role "cross-encoder").
    static PairScorerFactory onnxFactory(ModelRegistry* registry,
                                         std::string role = "cross-encoder");

    // Replaces similarity with the model score, stable-sorts descending and
    // keeps the first topK (all when unset). Load or inference failure is
    // returned as an error.
    Result<std::vector<SearchResult>> tryRerank(const QString& query,
                                                const std::vector<SearchResult>& candidates,
                                                std::optional<int> topK = std::nullopt);

    // As tryRerank, but any failure returns the candidates unchanged.
    std::vector<SearchResult> rerank(const QString& query,
                                     const std::vector<SearchResult>& candidates,
                                     std::optional<int> topK = std::nullopt);

    // Forces the one-time load. Returns the cached outcome afterwards.
    Status ensureLoaded();

    const RerankerConfig& config() const { return m_config; }

private:
    PairScorerFactory m_factory;
    RerankerConfig m_config;

    std::once_flag m_loadOnce;
    std::unique_ptr<PairScorer> m_scorer;
    Status m_loadStatus;
};

} // namespace sift
