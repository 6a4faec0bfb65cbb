#include "core/ranking/onnx_pair_scorer.h"

#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <algorithm>

#include <onnxruntime_cxx_api.h>

namespace sift {

OnnxPairScorer::OnnxPairScorer(ModelSession* session,
                               std::unique_ptr<WordPieceTokenizer> tokenizer)
    : m_session(session)
    , m_tokenizer(std::move(tokenizer))
{
    const auto& inputs = m_session->inputNames();
    m_feedsTokenTypes = std::find(inputs.begin(), inputs.end(), "token_type_ids") != inputs.end();
}

OnnxPairScorer::~OnnxPairScorer() = default;

Result<std::unique_ptr<PairScorer>> OnnxPairScorer::create(ModelRegistry* registry,
                                                           const std::string& role)
{
    if (!registry) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("no model registry"));
    }

    QString reason;
    ModelSession* session = registry->getSession(role, &reason);
    if (!session || !session->isAvailable()) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("cross-encoder unavailable: %1").arg(reason));
    }

    auto tokenizer = TokenizerFactory::create(session->manifest(), registry->modelsDir());
    if (!tokenizer) {
        return tokenizer.error();
    }

    std::unique_ptr<PairScorer> scorer(
        new OnnxPairScorer(session, std::move(tokenizer).value()));
    return scorer;
}

Result<std::vector<float>> OnnxPairScorer::scoreBatch(const QString& query,
                                                      const std::vector<QString>& passages)
{
    if (passages.empty()) {
        return std::vector<float>{};
    }

    auto* session = static_cast<Ort::Session*>(m_session->rawSession());
    if (!session) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("null ONNX session"));
    }

    std::vector<std::pair<QString, QString>> pairs;
    pairs.reserve(passages.size());
    for (const QString& passage : passages) {
        pairs.emplace_back(query, passage);
    }

    // Rows are padded to the longest row and masked, so a pair's logit does
    // not depend on what else is in the batch.
    WordPieceTokenizer::PairBatch batch = m_tokenizer->encodePairs(pairs);
    if (batch.batchSize != static_cast<int>(passages.size()) || batch.sequenceLength <= 0) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("tokenization produced no rows"));
    }

    try {
        const int64_t inputShape[2] = {
            static_cast<int64_t>(batch.batchSize),
            static_cast<int64_t>(batch.sequenceLength),
        };

        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(
            OrtAllocatorType::OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<Ort::Value> inputTensors;
        std::vector<const char*> inputNames;
        auto addInput = [&](const char* name, std::vector<int64_t>& data) {
            inputTensors.push_back(Ort::Value::CreateTensor<int64_t>(
                memoryInfo, data.data(), data.size(), inputShape, 2));
            inputNames.push_back(name);
        };

        addInput("input_ids", batch.inputIds);
        addInput("attention_mask", batch.attentionMask);
        if (m_feedsTokenTypes) {
            addInput("token_type_ids", batch.tokenTypeIds);
        }

        const char* outputNames[1] = {m_session->outputNames().front().c_str()};

        std::vector<Ort::Value> outputs = session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(), inputTensors.data(), inputTensors.size(),
            outputNames, 1);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            return makeError(ErrorKind::Unavailable,
                             QStringLiteral("cross-encoder returned no tensor"));
        }

        const size_t elementCount =
            outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        const size_t rows = static_cast<size_t>(batch.batchSize);
        if (elementCount < rows) {
            return makeError(ErrorKind::DataIntegrity,
                             QStringLiteral("cross-encoder output has %1 values for %2 pairs")
                                 .arg(static_cast<qulonglong>(elementCount))
                                 .arg(static_cast<qulonglong>(rows)));
        }

        // Single-logit heads give stride 1; two-class heads give stride 2 and
        // the relevance logit is the last column.
        const size_t stride = elementCount / rows;
        const float* logits = outputs[0].GetTensorData<float>();

        std::vector<float> scores;
        scores.reserve(rows);
        for (size_t i = 0; i < rows; ++i) {
            scores.push_back(logits[i * stride + (stride - 1)]);
        }
        return scores;
    } catch (const Ort::Exception& ex) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("cross-encoder inference failed: %1")
                             .arg(QString::fromUtf8(ex.what())));
    }
}

} // namespace sift
