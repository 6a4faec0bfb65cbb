#pragma once

#include "core/shared/result.h"

#include <QString>

#include <functional>
#include <memory>
#include <vector>

namespace sift {

// PairScorer: relevance model over (query, passage) pairs.
// scoreBatch returns one raw logit per passage, in passage order. The logit
// of a passage depends only on that pair, never on its batch neighbours.
// scoreBatch may run on several threads at once.
class PairScorer {
public:
    virtual ~PairScorer() = default;

    virtual Result<std::vector<float>> scoreBatch(const QString& query,
                                                  const std::vector<QString>& passages) = 0;
};

// Builds the scorer on first use. Called at most once per reranker.
using PairScorerFactory = std::function<Result<std::unique_ptr<PairScorer>>()>;

} // namespace sift
