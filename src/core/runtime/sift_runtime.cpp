#include "core/runtime/sift_runtime.h"

#include "core/embedding/embedder.h"
#include "core/embedding/embedding_client.h"
#include "core/index/sqlite_store.h"
#include "core/indexing/ingestion_pipeline.h"
#include "core/models/model_registry.h"
#include "core/ranking/cross_encoder_reranker.h"
#include "core/search/hybrid_searcher.h"
#include "core/search/keyword_search.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"
#include "core/vector/vector_search.h"

#include <QDir>
#include <QFileInfo>

namespace sift {

SiftRuntime::SiftRuntime(const Settings& settings)
    : m_settings(settings)
{
}

SiftRuntime::~SiftRuntime() = default;

Result<std::unique_ptr<SiftRuntime>> SiftRuntime::open(const Settings& settings,
                                                       std::unique_ptr<EmbeddingClient> embeddingClient,
                                                       PairScorerFactory scorerFactory)
{
    if (settings.dbPath.isEmpty()) {
        return makeError(ErrorKind::Validation, QStringLiteral("no database path configured"));
    }
    if (settings.embeddingDimensions < 1) {
        return makeError(ErrorKind::Validation,
                         QStringLiteral("embedding dimensions must be positive"));
    }
    if (!QDir().mkpath(QFileInfo(settings.dbPath).absolutePath())) {
        return makeError(ErrorKind::Storage,
                         QStringLiteral("cannot create data directory for %1").arg(settings.dbPath));
    }

    std::unique_ptr<SiftRuntime> runtime(new SiftRuntime(settings));

    QString storeError;
    runtime->m_store = SQLiteStore::open(settings.dbPath, settings.embeddingDimensions, &storeError);
    if (!runtime->m_store) {
        return makeError(ErrorKind::Storage, storeError);
    }

    runtime->m_vectorIndex = std::make_unique<VectorIndex>(settings.embeddingDimensions);
    if (!runtime->m_vectorIndex->rebuildFrom(*runtime->m_store)) {
        return makeError(ErrorKind::DataIntegrity,
                         QStringLiteral("failed to rebuild vector index from %1")
                             .arg(settings.dbPath));
    }

    if (embeddingClient) {
        runtime->m_embeddingClient = std::move(embeddingClient);
    } else {
        HttpEmbeddingClientConfig clientConfig;
        clientConfig.baseUrl = settings.embeddingBaseUrl;
        clientConfig.model = settings.embeddingModel;
        clientConfig.timeoutMs = settings.embeddingTimeoutMs;
        clientConfig.connectTimeoutMs = settings.embeddingConnectTimeoutMs;
        runtime->m_embeddingClient = std::make_unique<HttpEmbeddingClient>(clientConfig);
    }

    EmbedderConfig embedderConfig;
    embedderConfig.batchSize = settings.embeddingBatchSize;
    embedderConfig.dimensions = settings.embeddingDimensions;
    runtime->m_embedder = std::make_unique<Embedder>(runtime->m_embeddingClient.get(),
                                                     embedderConfig);

    runtime->m_vectorSearch = std::make_unique<VectorSearch>(runtime->m_store.get(),
                                                             runtime->m_vectorIndex.get());
    runtime->m_keywordSearch = std::make_unique<KeywordSearch>(runtime->m_store.get());

    HybridConfig hybridConfig;
    hybridConfig.vectorThreshold = settings.similarityThreshold;
    hybridConfig.keywordThreshold = settings.keywordThreshold;
    hybridConfig.rrfK = settings.rrfK;
    hybridConfig.allowDegraded = settings.allowDegradedHybrid;
    runtime->m_hybrid = std::make_unique<HybridSearcher>(runtime->m_vectorSearch.get(),
                                                         runtime->m_keywordSearch.get(),
                                                         hybridConfig);

    if (settings.rerankerEnabled) {
        if (!scorerFactory) {
            runtime->m_modelRegistry = std::make_unique<ModelRegistry>(settings.modelsDir);
            scorerFactory = CrossEncoderReranker::onnxFactory(runtime->m_modelRegistry.get());
        }
        RerankerConfig rerankerConfig;
        rerankerConfig.batchSize = settings.rerankerBatchSize;
        runtime->m_reranker = std::make_unique<CrossEncoderReranker>(std::move(scorerFactory),
                                                                     rerankerConfig);
    }

    RetrievalConfig retrievalConfig;
    retrievalConfig.similarityThreshold = settings.similarityThreshold;
    retrievalConfig.vectorWeight = settings.hybridVectorWeight;
    retrievalConfig.keywordWeight = settings.hybridKeywordWeight;
    retrievalConfig.rerankerTopK = settings.rerankerTopK;
    runtime->m_engine = std::make_unique<RetrievalEngine>(runtime->m_embedder.get(),
                                                          runtime->m_vectorSearch.get(),
                                                          runtime->m_hybrid.get(),
                                                          runtime->m_reranker.get(),
                                                          retrievalConfig);

    ChunkerConfig chunkerConfig;
    chunkerConfig.chunkSize = settings.chunkSize;
    chunkerConfig.chunkOverlap = settings.chunkOverlap;
    chunkerConfig.maxTokens = settings.maxTokensPerChunk;
    chunkerConfig.minChunkChars = settings.minChunkChars;
    chunkerConfig.useSemanticSplitting = settings.semanticChunking;
    runtime->m_ingestion = std::make_unique<IngestionPipeline>(runtime->m_store.get(),
                                                               runtime->m_vectorIndex.get(),
                                                               runtime->m_embedder.get(),
                                                               chunkerConfig);

    LOG_INFO(siftCore, "Runtime ready: db=%s, dims=%d, %d vector(s), reranker=%s",
             qUtf8Printable(settings.dbPath), settings.embeddingDimensions,
             runtime->m_vectorIndex->totalElements(),
             runtime->m_reranker ? "on" : "off");
    return runtime;
}

SearchRequest SiftRuntime::defaultRequest() const
{
    SearchRequest request;
    request.limit = m_settings.topK;
    request.mode = m_settings.useHybridSearch ? SearchMode::Hybrid : SearchMode::Vector;
    request.rerank = m_settings.rerankerEnabled;
    return request;
}

Status SiftRuntime::deleteDocument(const QString& documentId)
{
    std::vector<int64_t> removedRowIds;
    const Status deleted = m_store->deleteDocument(documentId, &removedRowIds);
    if (!deleted) {
        return deleted;
    }
    int unindexed = 0;
    for (int64_t rowId : removedRowIds) {
        // Chunks stored without an embedding never got a label.
        if (!m_vectorIndex->deleteVector(static_cast<uint64_t>(rowId))) {
            ++unindexed;
        }
    }
    LOG_INFO(siftCore, "Deleted document %s (%zu chunk(s), %d without vector)",
             qUtf8Printable(documentId), removedRowIds.size(), unindexed);
    return Status::success();
}

Status SiftRuntime::resetCorpus()
{
    const Status cleared = m_store->deleteAll();
    if (!cleared) {
        return cleared;
    }
    m_vectorIndex->clear();
    LOG_WARN(siftCore, "Corpus reset");
    return Status::success();
}

Result<QJsonObject> SiftRuntime::stats()
{
    auto documents = m_store->documentCount();
    if (!documents) {
        return documents.error();
    }
    auto chunks = m_store->chunkCount();
    if (!chunks) {
        return chunks.error();
    }
    auto embedded = m_store->embeddedChunkCount();
    if (!embedded) {
        return embedded.error();
    }

    QJsonObject json;
    json.insert(QStringLiteral("documents"), static_cast<qint64>(documents.value()));
    json.insert(QStringLiteral("chunks"), static_cast<qint64>(chunks.value()));
    json.insert(QStringLiteral("embedded_chunks"), static_cast<qint64>(embedded.value()));
    json.insert(QStringLiteral("vector_index_elements"), m_vectorIndex->totalElements());
    json.insert(QStringLiteral("vector_index_deleted"), m_vectorIndex->deletedElements());
    json.insert(QStringLiteral("embedding_dimensions"), m_settings.embeddingDimensions);
    json.insert(QStringLiteral("fuzzy_keyword_matching"), m_store->fuzzyMatcherAvailable());
    json.insert(QStringLiteral("hybrid_search"), m_settings.useHybridSearch);
    json.insert(QStringLiteral("reranker_enabled"), m_reranker != nullptr);
    json.insert(QStringLiteral("embedding_circuit_open"),
                m_embedder->circuitBreaker().isOpen());
    return json;
}

} // namespace sift
