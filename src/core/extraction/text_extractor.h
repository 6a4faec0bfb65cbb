#pragma once

#include "core/extraction/extractor.h"
#include <QSet>

namespace sift {

// PlainTextExtractor: reads txt/text/md/markdown/rst files.
//
// Decodes UTF-8, falling back to Latin-1 when the bytes are not valid UTF-8,
// and cleans the result with TextCleaner. Markdown files also get a
// DocumentStructure for semantic chunking.
//
// Size limit: files larger than 50 MB are rejected with SizeExceeded.
class PlainTextExtractor : public FileExtractor {
public:
    ExtractionResult extract(const QString& filePath) override;
    bool supports(const QString& extension) const override;

    static const QSet<QString>& supportedExtensions();
    static bool isMarkdown(const QString& extension);
};

} // namespace sift
