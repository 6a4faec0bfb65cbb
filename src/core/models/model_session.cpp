#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <algorithm>

#include <onnxruntime_cxx_api.h>

namespace sift {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "sift-models");
    return env;
}

} // anonymous namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath, QString* errorOut)
{
    auto fail = [&](const QString& reason) {
        LOG_WARN(siftRanking, "ModelSession: %s", qUtf8Printable(reason));
        if (errorOut) {
            *errorOut = reason;
        }
        m_impl->session.reset();
        m_available = false;
        return false;
    };

    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        return fail(QStringLiteral("model file missing at %1").arg(modelPath));
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(2);
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;

        m_inputNames.clear();
        const size_t inputCount = m_impl->session->GetInputCount();
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetInputNameAllocated(i, allocator);
            if (name.get() != nullptr) {
                m_inputNames.emplace_back(name.get());
            }
        }

        for (const QString& expectedInput : m_manifest.inputs) {
            const std::string expected = expectedInput.toStdString();
            if (std::find(m_inputNames.begin(), m_inputNames.end(), expected)
                == m_inputNames.end()) {
                return fail(QStringLiteral("required input '%1' not found in %2")
                                .arg(expectedInput, m_manifest.name));
            }
        }

        m_outputNames.clear();
        const size_t outputCount = m_impl->session->GetOutputCount();
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (name.get() != nullptr && name.get()[0] != '\0') {
                m_outputNames.emplace_back(name.get());
            }
        }

        if (m_outputNames.empty()) {
            return fail(QStringLiteral("no output names found in %1").arg(m_manifest.name));
        }

        LOG_INFO(siftRanking, "ModelSession: initialized '%s', %zu inputs, %zu outputs",
                 qUtf8Printable(m_manifest.name), m_inputNames.size(), m_outputNames.size());
        m_available = true;
        return true;
    } catch (const Ort::Exception& ex) {
        return fail(QStringLiteral("ONNX initialization failed: %1")
                        .arg(QString::fromUtf8(ex.what())));
    }
}

void* ModelSession::rawSession() const
{
    return m_impl->session ? m_impl->session.get() : nullptr;
}

} // namespace sift
