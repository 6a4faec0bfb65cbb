#pragma once

#include "core/embedding/embedding_client.h"
#include "core/shared/chunk.h"
#include "core/shared/result.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

namespace sift {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    // True while calls are refused. Turns false once the delay has elapsed
    // (half-open) and never changes state.
    bool isOpen() const;
    // Whether the caller may contact the service now. In the half-open state
    // only the caller that claims the window is admitted; the rest are refused
    // until its outcome is recorded.
    bool allowRequest();
    void recordSuccess();
    void recordFailure();
};

struct EmbedderConfig {
    int batchSize = 50;
    int dimensions = 768;
};

struct EmbedItemError {
    int chunkIndex = 0;
    Error error;
};

struct EmbedReport {
    int embedded = 0;
    int failed = 0;
    std::vector<EmbedItemError> errors;
};

// Embedder: annotates chunks with vectors from an EmbeddingClient.
//
// Chunks are processed in batches of batchSize with one sequential call per
// chunk. A chunk whose call fails stays in place with its embedding absent;
// the failure is logged and listed in the EmbedReport.
class Embedder {
public:
    using Config = EmbedderConfig;
    using ProgressCallback = std::function<void(int batch, int totalBatches)>;

    Embedder(EmbeddingClient* client, const Config& config = {});

    Embedder(const Embedder&) = delete;
    Embedder& operator=(const Embedder&) = delete;

    EmbedReport embedChunks(std::vector<Chunk>& chunks,
                            const ProgressCallback& progress = {});

    // Failure is fatal for the search that needs the vector.
    Result<Embedding> embedQuery(const QString& text);

    int dimensions() const { return m_config.dimensions; }

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    Result<Embedding> embedOne(const QString& text);

    EmbeddingClient* m_client = nullptr;
    Config m_config;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace sift
