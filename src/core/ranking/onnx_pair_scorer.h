#pragma once

#include "core/models/wordpiece_tokenizer.h"
#include "core/ranking/pair_scorer.h"

#include <memory>
#include <string>

namespace sift {

class ModelRegistry;
class ModelSession;

// OnnxPairScorer: cross-encoder (e.g. ms-marco-MiniLM) run through
// ONNX Runtime. Feeds input_ids / attention_mask / token_type_ids and reads
// the first output as [batch, 1] (or [batch]) logits.
class OnnxPairScorer : public PairScorer {
public:
    ~OnnxPairScorer() override;

    OnnxPairScorer(const OnnxPairScorer&) = delete;
    OnnxPairScorer& operator=(const OnnxPairScorer&) = delete;

    // Loads the session for `role` and its tokenizer. Unavailable when the
    // manifest, model or vocab is missing.
    static Result<std::unique_ptr<PairScorer>> create(ModelRegistry* registry,
                                                      const std::string& role);

    Result<std::vector<float>> scoreBatch(const QString& query,
                                          const std::vector<QString>& passages) override;

private:
    OnnxPairScorer(ModelSession* session, std::unique_ptr<WordPieceTokenizer> tokenizer);

    ModelSession* m_session = nullptr;  // Owned by ModelRegistry
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_feedsTokenTypes = false;
};

} // namespace sift
