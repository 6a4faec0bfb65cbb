#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace sift {

// ModelSession: one loaded ONNX Runtime session (CPU provider).
class ModelSession {
public:
    explicit ModelSession(const ModelManifestEntry& manifest);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;
    ModelSession(ModelSession&&) = delete;
    ModelSession& operator=(ModelSession&&) = delete;

    // Loads the model and checks that every manifest input exists.
    // On failure *errorOut carries the reason.
    bool initialize(const QString& modelPath, QString* errorOut = nullptr);
    bool isAvailable() const { return m_available; }

    const ModelManifestEntry& manifest() const { return m_manifest; }
    const std::vector<std::string>& inputNames() const { return m_inputNames; }
    const std::vector<std::string>& outputNames() const { return m_outputNames; }

    // Returns the underlying Ort::Session* as void* so the ONNX header stays
    // out of this one. Cast back in .cpp files that include it.
    void* rawSession() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelManifestEntry m_manifest;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace sift
