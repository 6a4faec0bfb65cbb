#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <unordered_map>

namespace sift {

// ModelRegistry: lazily loads ONNX sessions for roles named in
// <modelsDir>/manifest.json and caches them for the process lifetime.
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // Lazy-creates and caches a ModelSession for the given role
    // (e.g. "cross-encoder"). When the role fails to load and names a
    // fallbackRole, that role is tried instead. Returns nullptr on failure
    // with the reason in *errorOut.
    ModelSession* getSession(const std::string& role, QString* errorOut = nullptr);

    // Checks whether the manifest contains a model for the given role
    // without loading it.
    bool hasModel(const std::string& role) const;

    bool manifestLoaded() const { return m_manifestLoaded; }
    const ModelManifest& manifest() const { return m_manifest; }
    const QString& modelsDir() const { return m_modelsDir; }

private:
    ModelSession* getSessionUnlocked(const std::string& role,
                                     std::unordered_set<std::string>& visited,
                                     QString* errorOut);

    QString m_modelsDir;
    ModelManifest m_manifest;
    bool m_manifestLoaded = false;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    mutable std::mutex m_mutex;
};

} // namespace sift
