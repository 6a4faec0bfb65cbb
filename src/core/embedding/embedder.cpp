#include "core/embedding/embedder.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace sift {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

bool EmbeddingCircuitBreaker::allowRequest()
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return true;
    }
    const int64_t now = steadyNowMs();
    int64_t lastFail = lastFailureTime.load();
    if (now - lastFail < kHalfOpenDelayMs) {
        return false;
    }
    // Half-open: restarting the delay claims the single trial call.
    return lastFailureTime.compare_exchange_strong(lastFail, now);
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

Embedder::Embedder(EmbeddingClient* client, const Config& config)
    : m_client(client)
    , m_config(config)
{
    m_config.batchSize = std::max(1, m_config.batchSize);
}

EmbedReport Embedder::embedChunks(std::vector<Chunk>& chunks, const ProgressCallback& progress)
{
    EmbedReport report;
    if (chunks.empty()) {
        return report;
    }

    const int total = static_cast<int>(chunks.size());
    const int totalBatches = (total + m_config.batchSize - 1) / m_config.batchSize;

    for (int batch = 0; batch < totalBatches; ++batch) {
        const int begin = batch * m_config.batchSize;
        const int end = std::min(total, begin + m_config.batchSize);

        for (int i = begin; i < end; ++i) {
            Chunk& chunk = chunks[static_cast<size_t>(i)];
            auto result = embedOne(chunk.content);
            if (result) {
                chunk.embedding = std::move(result).value();
                ++report.embedded;
                continue;
            }

            chunk.embedding.reset();
            ++report.failed;

            Error error = result.error();
            if (error.kind != ErrorKind::DataIntegrity) {
                error.kind = ErrorKind::PartialItem;
            }
            LOG_WARN(siftEmbed, "Chunk %d failed to embed: %s",
                     chunk.chunkIndex, qUtf8Printable(error.message));
            report.errors.push_back({chunk.chunkIndex, std::move(error)});
        }

        LOG_DEBUG(siftEmbed, "Embedded batch %d/%d", batch + 1, totalBatches);
        if (progress) {
            progress(batch + 1, totalBatches);
        }
    }

    if (report.failed > 0) {
        LOG_WARN(siftEmbed, "Embedding finished with %d/%d failures", report.failed, total);
    }
    return report;
}

Result<Embedding> Embedder::embedQuery(const QString& text)
{
    auto result = embedOne(text);
    if (!result) {
        LOG_ERROR(siftEmbed, "Query embedding failed: %s",
                  qUtf8Printable(result.error().message));
    }
    return result;
}

Result<Embedding> Embedder::embedOne(const QString& text)
{
    if (!m_client) {
        return makeError(ErrorKind::Unavailable, QStringLiteral("no embedding client configured"));
    }
    if (!m_circuitBreaker.allowRequest()) {
        return makeError(ErrorKind::Connectivity,
                         QStringLiteral("embedding service circuit open after repeated failures"));
    }

    auto result = m_client->embed(text);
    if (!result) {
        m_circuitBreaker.recordFailure();
        return result;
    }
    m_circuitBreaker.recordSuccess();

    const Embedding& embedding = result.value();
    if (static_cast<int>(embedding.size()) != m_config.dimensions) {
        return makeError(ErrorKind::DataIntegrity,
                         QStringLiteral("embedding has %1 dimensions, expected %2")
                             .arg(static_cast<int>(embedding.size()))
                             .arg(m_config.dimensions));
    }
    for (float v : embedding) {
        if (!std::isfinite(v)) {
            return makeError(ErrorKind::DataIntegrity,
                             QStringLiteral("embedding contains a non-finite value"));
        }
    }
    return result;
}

} // namespace sift
