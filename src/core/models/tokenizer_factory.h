#pragma once

#include "core/models/model_manifest.h"
#include "core/models/wordpiece_tokenizer.h"
#include "core/shared/result.h"

#include <QString>

#include <memory>

namespace sift {

class TokenizerFactory {
public:
    // Creates the tokenizer a manifest entry asks for. Only "wordpiece" is
    // supported; other types and missing vocab files are Unavailable.
    static Result<std::unique_ptr<WordPieceTokenizer>> create(const ModelManifestEntry& entry,
                                                              const QString& modelsDir);
};

} // namespace sift
