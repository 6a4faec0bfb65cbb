#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QDir>

namespace sift {

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(QDir::cleanPath(modelsDir))
{
    const QString manifestPath = QDir(m_modelsDir).filePath(QStringLiteral("manifest.json"));
    std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath);
    if (loaded.has_value()) {
        m_manifest = std::move(loaded.value());
        m_manifestLoaded = true;
        LOG_INFO(siftRanking, "ModelRegistry: loaded manifest with %zu model(s) from %s",
                 m_manifest.models.size(), qUtf8Printable(manifestPath));
    } else {
        LOG_WARN(siftRanking, "ModelRegistry: no usable manifest at %s",
                 qUtf8Printable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const std::string& role, QString* errorOut)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::unordered_set<std::string> visited;
    visited.insert(role);
    return getSessionUnlocked(role, visited, errorOut);
}

ModelSession* ModelRegistry::getSessionUnlocked(const std::string& role,
                                                std::unordered_set<std::string>& visited,
                                                QString* errorOut)
{
    auto sessionIt = m_sessions.find(role);
    if (sessionIt != m_sessions.end()) {
        return sessionIt->second.get();
    }

    auto manifestIt = m_manifest.models.find(role);
    if (manifestIt == m_manifest.models.end()) {
        if (errorOut) {
            *errorOut = QStringLiteral("no model configured for role '%1' in %2")
                            .arg(QString::fromStdString(role), m_modelsDir);
        }
        return nullptr;
    }

    const ModelManifestEntry& entry = manifestIt->second;
    auto session = std::make_unique<ModelSession>(entry);
    if (!session->initialize(QDir(m_modelsDir).filePath(entry.file), errorOut)) {
        if (!entry.fallbackRole.isEmpty()) {
            const std::string fallbackRole = entry.fallbackRole.toStdString();
            if (!visited.count(fallbackRole)) {
                visited.insert(fallbackRole);
                LOG_WARN(siftRanking,
                         "ModelRegistry: role '%s' failed, trying fallback role '%s'",
                         role.c_str(), fallbackRole.c_str());
                return getSessionUnlocked(fallbackRole, visited, errorOut);
            }
        }
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions[role] = std::move(session);
    return raw;
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.models.find(role) != m_manifest.models.end();
}

} // namespace sift
