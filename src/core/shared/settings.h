#pragma once

#include <QString>
#include <cstdint>

namespace sift {

struct Settings {
    // Database
    QString dbPath;

    // Embedding service
    QString embeddingBaseUrl = QStringLiteral("http://localhost:11434");
    QString embeddingModel = QStringLiteral("nomic-embed-text");
    int embeddingTimeoutMs = 300000;
    int embeddingConnectTimeoutMs = 10000;
    int embeddingDimensions = 768;
    int embeddingBatchSize = 50;

    // Chunking
    int chunkSize = 1000;
    int chunkOverlap = 200;
    int maxTokensPerChunk = 512;
    int minChunkChars = 100;
    bool semanticChunking = true;

    // Retrieval
    int topK = 5;
    double similarityThreshold = 0.3;
    double keywordThreshold = 0.3;
    bool useHybridSearch = true;
    double hybridVectorWeight = 0.6;
    double hybridKeywordWeight = 0.4;
    int rrfK = 60;
    bool allowDegradedHybrid = false;

    // Reranker
    bool rerankerEnabled = true;
    QString modelsDir;
    int rerankerTopK = 30;
    int rerankerBatchSize = 32;

    // Logging
    QString logLevel = QStringLiteral("info");
};

} // namespace sift
