#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace sift {

namespace {

bool envFlagEnabled(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    return normalized == QStringLiteral("1")
        || normalized == QStringLiteral("true")
        || normalized == QStringLiteral("yes")
        || normalized == QStringLiteral("on");
}

int readEnvInt(const QProcessEnvironment& env, const QString& key, int fallback,
               int minValue, int maxValue)
{
    if (!env.contains(key)) {
        return fallback;
    }
    bool ok = false;
    const int parsed = env.value(key).trimmed().toInt(&ok);
    if (!ok) {
        LOG_WARN(siftCore, "Ignoring non-numeric %s", qUtf8Printable(key));
        return fallback;
    }
    return std::clamp(parsed, minValue, maxValue);
}

} // namespace

std::optional<Settings> SettingsManager::load()
{
    return loadFromFile(settingsFilePath());
}

std::optional<Settings> SettingsManager::loadFromFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(siftCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(siftCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

Settings SettingsManager::resolve()
{
    Settings settings = load().value_or(Settings{});
    applyEnvironment(settings, QProcessEnvironment::systemEnvironment());

    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDataDir() + QStringLiteral("/sift.db");
    }
    if (settings.modelsDir.isEmpty()) {
        settings.modelsDir = defaultDataDir() + QStringLiteral("/models");
    }
    return settings;
}

bool SettingsManager::save(const Settings& settings)
{
    return saveToFile(settings, settingsFilePath());
}

bool SettingsManager::saveToFile(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(siftCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(siftCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(siftCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath =
        QProcessEnvironment::systemEnvironment().value(QStringLiteral("SIFT_SETTINGS"));
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return defaultDataDir() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/sift");
}

void SettingsManager::applyEnvironment(Settings& settings, const QProcessEnvironment& env)
{
    if (env.contains(QStringLiteral("SIFT_DB_PATH"))) {
        settings.dbPath = env.value(QStringLiteral("SIFT_DB_PATH"));
    }
    if (env.contains(QStringLiteral("SIFT_EMBED_URL"))) {
        settings.embeddingBaseUrl = env.value(QStringLiteral("SIFT_EMBED_URL"));
    }
    if (env.contains(QStringLiteral("SIFT_EMBED_MODEL"))) {
        settings.embeddingModel = env.value(QStringLiteral("SIFT_EMBED_MODEL"));
    }
    settings.embeddingTimeoutMs = readEnvInt(env, QStringLiteral("SIFT_EMBED_TIMEOUT_MS"),
                                             settings.embeddingTimeoutMs, 100, 3600000);
    settings.embeddingDimensions = readEnvInt(env, QStringLiteral("SIFT_EMBED_DIMENSIONS"),
                                              settings.embeddingDimensions, 1, 65536);
    if (env.contains(QStringLiteral("SIFT_MODELS_DIR"))) {
        settings.modelsDir = env.value(QStringLiteral("SIFT_MODELS_DIR"));
    }
    if (env.contains(QStringLiteral("SIFT_RERANKER_ENABLED"))) {
        settings.rerankerEnabled = envFlagEnabled(env.value(QStringLiteral("SIFT_RERANKER_ENABLED")));
    }
    if (env.contains(QStringLiteral("SIFT_LOG_LEVEL"))) {
        settings.logLevel = env.value(QStringLiteral("SIFT_LOG_LEVEL"));
    }
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("embeddingBaseUrl"), settings.embeddingBaseUrl);
    json.insert(QStringLiteral("embeddingModel"), settings.embeddingModel);
    json.insert(QStringLiteral("embeddingTimeoutMs"), settings.embeddingTimeoutMs);
    json.insert(QStringLiteral("embeddingConnectTimeoutMs"), settings.embeddingConnectTimeoutMs);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("maxTokensPerChunk"), settings.maxTokensPerChunk);
    json.insert(QStringLiteral("minChunkChars"), settings.minChunkChars);
    json.insert(QStringLiteral("semanticChunking"), settings.semanticChunking);
    json.insert(QStringLiteral("topK"), settings.topK);
    json.insert(QStringLiteral("similarityThreshold"), settings.similarityThreshold);
    json.insert(QStringLiteral("keywordThreshold"), settings.keywordThreshold);
    json.insert(QStringLiteral("useHybridSearch"), settings.useHybridSearch);
    json.insert(QStringLiteral("hybridVectorWeight"), settings.hybridVectorWeight);
    json.insert(QStringLiteral("hybridKeywordWeight"), settings.hybridKeywordWeight);
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    json.insert(QStringLiteral("allowDegradedHybrid"), settings.allowDegradedHybrid);
    json.insert(QStringLiteral("rerankerEnabled"), settings.rerankerEnabled);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("rerankerTopK"), settings.rerankerTopK);
    json.insert(QStringLiteral("rerankerBatchSize"), settings.rerankerBatchSize);
    json.insert(QStringLiteral("logLevel"), settings.logLevel);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.embeddingBaseUrl =
        json.value(QStringLiteral("embeddingBaseUrl")).toString(settings.embeddingBaseUrl);
    settings.embeddingModel =
        json.value(QStringLiteral("embeddingModel")).toString(settings.embeddingModel);
    settings.embeddingTimeoutMs =
        json.value(QStringLiteral("embeddingTimeoutMs")).toInt(settings.embeddingTimeoutMs);
    settings.embeddingConnectTimeoutMs =
        json.value(QStringLiteral("embeddingConnectTimeoutMs"))
            .toInt(settings.embeddingConnectTimeoutMs);
    settings.embeddingDimensions =
        json.value(QStringLiteral("embeddingDimensions")).toInt(settings.embeddingDimensions);
    settings.embeddingBatchSize =
        std::max(1, json.value(QStringLiteral("embeddingBatchSize")).toInt(settings.embeddingBatchSize));

    settings.chunkSize = json.value(QStringLiteral("chunkSize")).toInt(settings.chunkSize);
    settings.chunkOverlap = json.value(QStringLiteral("chunkOverlap")).toInt(settings.chunkOverlap);
    settings.maxTokensPerChunk =
        json.value(QStringLiteral("maxTokensPerChunk")).toInt(settings.maxTokensPerChunk);
    settings.minChunkChars = json.value(QStringLiteral("minChunkChars")).toInt(settings.minChunkChars);
    settings.semanticChunking =
        json.value(QStringLiteral("semanticChunking")).toBool(settings.semanticChunking);

    settings.topK = json.value(QStringLiteral("topK")).toInt(settings.topK);
    settings.similarityThreshold =
        json.value(QStringLiteral("similarityThreshold")).toDouble(settings.similarityThreshold);
    settings.keywordThreshold =
        json.value(QStringLiteral("keywordThreshold")).toDouble(settings.keywordThreshold);
    settings.useHybridSearch =
        json.value(QStringLiteral("useHybridSearch")).toBool(settings.useHybridSearch);
    settings.hybridVectorWeight =
        json.value(QStringLiteral("hybridVectorWeight")).toDouble(settings.hybridVectorWeight);
    settings.hybridKeywordWeight =
        json.value(QStringLiteral("hybridKeywordWeight")).toDouble(settings.hybridKeywordWeight);
    settings.rrfK = json.value(QStringLiteral("rrfK")).toInt(settings.rrfK);
    settings.allowDegradedHybrid =
        json.value(QStringLiteral("allowDegradedHybrid")).toBool(settings.allowDegradedHybrid);

    settings.rerankerEnabled =
        json.value(QStringLiteral("rerankerEnabled")).toBool(settings.rerankerEnabled);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);
    settings.rerankerTopK = json.value(QStringLiteral("rerankerTopK")).toInt(settings.rerankerTopK);
    settings.rerankerBatchSize =
        std::max(1, json.value(QStringLiteral("rerankerBatchSize")).toInt(settings.rerankerBatchSize));

    settings.logLevel = json.value(QStringLiteral("logLevel")).toString(settings.logLevel);

    return settings;
}

} // namespace sift
