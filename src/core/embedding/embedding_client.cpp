#include "core/embedding/embedding_client.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <curl/curl.h>

#include <mutex>

namespace sift {

namespace {

std::once_flag g_curlInitOnce;

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    const size_t total = size * nmemb;
    if (userdata == nullptr) {
        return 0;
    }
    auto* body = static_cast<QByteArray*>(userdata);
    body->append(ptr, static_cast<qsizetype>(total));
    return total;
}

// Easy handle and header list released together.
struct CurlRequest {
    CURL* handle = nullptr;
    curl_slist* headers = nullptr;

    CurlRequest() : handle(curl_easy_init()) {}
    ~CurlRequest()
    {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (handle) {
            curl_easy_cleanup(handle);
        }
    }

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;
};

Error makeCurlError(CURLcode code, const char* where)
{
    const QString message = QStringLiteral("%1: %2")
                                .arg(QString::fromUtf8(where),
                                     QString::fromUtf8(curl_easy_strerror(code)));
    return makeError(ErrorKind::Connectivity, message);
}

} // namespace

HttpEmbeddingClient::HttpEmbeddingClient(const Config& config)
    : m_config(config)
{
    std::call_once(g_curlInitOnce, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    QString base = m_config.baseUrl;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    m_endpoint = (base + QStringLiteral("/api/embeddings")).toUtf8();
}

HttpEmbeddingClient::~HttpEmbeddingClient() = default;

Result<Embedding> HttpEmbeddingClient::embed(const QString& text)
{
    CurlRequest request;
    if (!request.handle) {
        return makeError(ErrorKind::Connectivity, QStringLiteral("curl_easy_init failed"));
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("model"), m_config.model);
    payload.insert(QStringLiteral("prompt"), text);
    const QByteArray requestBody = QJsonDocument(payload).toJson(QJsonDocument::Compact);

    QByteArray responseBody;
    request.headers = curl_slist_append(request.headers, "Content-Type: application/json");

    CURL* curl = request.handle;
    curl_easy_setopt(curl, CURLOPT_URL, m_endpoint.constData());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, request.headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, requestBody.constData());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(requestBody.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBody);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(m_config.connectTimeoutMs));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(m_config.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        return makeCurlError(code, "embedding request");
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return makeError(ErrorKind::Connectivity,
                         QStringLiteral("embedding service returned HTTP %1: %2")
                             .arg(status)
                             .arg(QString::fromUtf8(responseBody.left(200))));
    }

    return parseResponse(responseBody);
}

Result<Embedding> HttpEmbeddingClient::parseResponse(const QByteArray& body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return makeError(ErrorKind::Connectivity,
                         QStringLiteral("malformed embedding response: %1")
                             .arg(parseError.errorString()));
    }

    const QJsonValue value = doc.object().value(QStringLiteral("embedding"));
    if (!value.isArray()) {
        return makeError(ErrorKind::Connectivity,
                         QStringLiteral("embedding response has no \"embedding\" array"));
    }

    const QJsonArray array = value.toArray();
    if (array.isEmpty()) {
        return makeError(ErrorKind::Connectivity, QStringLiteral("embedding response is empty"));
    }

    Embedding embedding;
    embedding.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& element : array) {
        if (!element.isDouble()) {
            return makeError(ErrorKind::Connectivity,
                             QStringLiteral("embedding response holds a non-numeric value"));
        }
        embedding.push_back(static_cast<float>(element.toDouble()));
    }
    return embedding;
}

} // namespace sift
