#include "core/models/tokenizer_factory.h"

#include <QDir>
#include <QFile>

namespace sift {

Result<std::unique_ptr<WordPieceTokenizer>> TokenizerFactory::create(
    const ModelManifestEntry& entry, const QString& modelsDir)
{
    if (entry.tokenizer.compare(QStringLiteral("wordpiece"), Qt::CaseInsensitive) != 0) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("unsupported tokenizer type '%1' for %2")
                             .arg(entry.tokenizer, entry.name));
    }

    if (entry.vocab.isEmpty()) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("no vocab file specified for %1").arg(entry.name));
    }

    const QString vocabPath = QDir(modelsDir).filePath(entry.vocab);
    if (!QFile::exists(vocabPath)) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("vocab file not found at %1").arg(vocabPath));
    }

    auto tokenizer = std::make_unique<WordPieceTokenizer>(vocabPath, entry.maxSeqLength);
    if (!tokenizer->isLoaded()) {
        return makeError(ErrorKind::Unavailable,
                         QStringLiteral("failed to load vocab from %1").arg(vocabPath));
    }
    return tokenizer;
}

} // namespace sift
