#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace sift {

namespace {

std::vector<QString> stringList(const QJsonValue& value)
{
    std::vector<QString> out;
    const QJsonArray array = value.toArray();
    out.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& v : array) {
        if (v.isString()) {
            out.push_back(v.toString());
        }
    }
    return out;
}

std::optional<ModelManifestEntry> parseEntry(const QJsonObject& obj)
{
    const QString file = obj.value(QStringLiteral("file")).toString();
    if (file.isEmpty()) {
        return std::nullopt;
    }

    ModelManifestEntry entry;
    entry.file = file;
    entry.name = obj.value(QStringLiteral("name")).toString(file);
    entry.vocab = obj.value(QStringLiteral("vocab")).toString();
    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.fallbackRole = obj.value(QStringLiteral("fallbackRole")).toString();
    entry.maxSeqLength = obj.value(QStringLiteral("maxSeqLength")).toInt(512);
    entry.tokenizer = obj.value(QStringLiteral("tokenizer")).toString(QStringLiteral("wordpiece"));
    entry.inputs = stringList(obj.value(QStringLiteral("inputs")));
    entry.outputs = stringList(obj.value(QStringLiteral("outputs")));
    entry.outputTransform = obj.value(QStringLiteral("outputTransform")).toString();
    entry.task = obj.value(QStringLiteral("task")).toString();

    if (entry.maxSeqLength < 8) {
        entry.maxSeqLength = 512;
    }
    return entry;
}

} // namespace

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(siftRanking, "ModelManifest: cannot open %s", qUtf8Printable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(siftRanking, "ModelManifest: invalid JSON in %s: %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue modelsValue = root.value(QStringLiteral("models"));
    if (!modelsValue.isObject()) {
        LOG_WARN(siftRanking, "ModelManifest: missing or invalid 'models' key");
        return std::nullopt;
    }

    ModelManifest manifest;
    const QJsonObject modelsObj = modelsValue.toObject();
    for (auto it = modelsObj.begin(); it != modelsObj.end(); ++it) {
        std::optional<ModelManifestEntry> entry;
        if (it.value().isObject()) {
            entry = parseEntry(it.value().toObject());
        }
        if (!entry) {
            LOG_WARN(siftRanking, "ModelManifest: skipping malformed entry '%s'",
                     qUtf8Printable(it.key()));
            continue;
        }
        manifest.models[it.key().toStdString()] = std::move(*entry);
    }

    return manifest;
}

} // namespace sift
