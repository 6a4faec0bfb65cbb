#pragma once

#include <QString>
#include <QJsonObject>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sift {

// One ONNX model as described by <modelsDir>/manifest.json, keyed by role
// ("cross-encoder", ...).
struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    QString fallbackRole;
    int maxSeqLength = 512;
    QString tokenizer;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
    QString outputTransform;   // "" (raw logits) or "sigmoid"
    QString task;
};

struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace sift
