#pragma once

#include "core/ranking/pair_scorer.h"
#include "core/search/retrieval_engine.h"
#include "core/shared/result.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <memory>
#include <vector>

namespace sift {

class CrossEncoderReranker;
class Embedder;
class EmbeddingClient;
class HybridSearcher;
class IngestionPipeline;
class KeywordSearch;
class ModelRegistry;
class SQLiteStore;
class VectorIndex;
class VectorSearch;

// SiftRuntime: owns and wires every service for one corpus.
//
// Construction order follows dependencies: store, vector index (rebuilt
// from stored embeddings), embedding client + embedder, searchers, reranker,
// retrieval engine, ingestion pipeline. Components only hold raw pointers to
// what this object owns; destruction runs in reverse.
class SiftRuntime {
public:
    // embeddingClient: null builds an HttpEmbeddingClient from settings.
    // scorerFactory: empty uses the ONNX cross-encoder from settings.modelsDir.
    static Result<std::unique_ptr<SiftRuntime>> open(
        const Settings& settings,
        std::unique_ptr<EmbeddingClient> embeddingClient = nullptr,
        PairScorerFactory scorerFactory = {});

    ~SiftRuntime();

    SiftRuntime(const SiftRuntime&) = delete;
    SiftRuntime& operator=(const SiftRuntime&) = delete;
    SiftRuntime(SiftRuntime&&) = delete;
    SiftRuntime& operator=(SiftRuntime&&) = delete;

    RetrievalEngine& engine() { return *m_engine; }
    IngestionPipeline& ingestion() { return *m_ingestion; }
    SQLiteStore& store() { return *m_store; }
    VectorIndex& vectorIndex() { return *m_vectorIndex; }
    Embedder& embedder() { return *m_embedder; }
    CrossEncoderReranker* reranker() { return m_reranker.get(); }
    const Settings& settings() const { return m_settings; }

    // Request shaped by settings: topK, hybrid on/off, reranker on/off.
    SearchRequest defaultRequest() const;

    // Removes the document, its chunks and their vectors.
    Status deleteDocument(const QString& documentId);

    // Removes every document and empties the vector index.
    Status resetCorpus();

    // Corpus counts and component availability.
    Result<QJsonObject> stats();

private:
    explicit SiftRuntime(const Settings& settings);

    Settings m_settings;
    std::unique_ptr<SQLiteStore> m_store;
    std::unique_ptr<VectorIndex> m_vectorIndex;
    std::unique_ptr<EmbeddingClient> m_embeddingClient;
    std::unique_ptr<Embedder> m_embedder;
    std::unique_ptr<VectorSearch> m_vectorSearch;
    std::unique_ptr<KeywordSearch> m_keywordSearch;
    std::unique_ptr<HybridSearcher> m_hybrid;
    std::unique_ptr<ModelRegistry> m_modelRegistry;
    std::unique_ptr<CrossEncoderReranker> m_reranker;
    std::unique_ptr<RetrievalEngine> m_engine;
    std::unique_ptr<IngestionPipeline> m_ingestion;
};

} // namespace sift
