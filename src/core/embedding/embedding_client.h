#pragma once

#include "core/shared/chunk.h"
#include "core/shared/result.h"

#include <QString>

namespace sift {

// EmbeddingClient: one text in, one vector out. Implementations must bound
// every call with a timeout and report failures as ErrorKind::Connectivity.
class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;

    virtual Result<Embedding> embed(const QString& text) = 0;
};

struct HttpEmbeddingClientConfig {
    QString baseUrl = QStringLiteral("http://localhost:11434");
    QString model = QStringLiteral("nomic-embed-text");
    int connectTimeoutMs = 10000;
    int timeoutMs = 300000;
};

// HttpEmbeddingClient: POST {"model", "prompt"} to {baseUrl}/api/embeddings
// and read {"embedding": [...]} from the response body.
class HttpEmbeddingClient : public EmbeddingClient {
public:
    using Config = HttpEmbeddingClientConfig;

    explicit HttpEmbeddingClient(const Config& config = {});
    ~HttpEmbeddingClient() override;

    HttpEmbeddingClient(const HttpEmbeddingClient&) = delete;
    HttpEmbeddingClient& operator=(const HttpEmbeddingClient&) = delete;
    HttpEmbeddingClient(HttpEmbeddingClient&&) = delete;
    HttpEmbeddingClient& operator=(HttpEmbeddingClient&&) = delete;

    Result<Embedding> embed(const QString& text) override;

    // Parses an embeddings response body. Exposed for testing.
    static Result<Embedding> parseResponse(const QByteArray& body);

    const Config& config() const { return m_config; }

private:
    Config m_config;
    QByteArray m_endpoint;
};

} // namespace sift
