#pragma once

#include "core/indexing/document_structure.h"

#include <QString>
#include <optional>

namespace sift {

// Result of a content extraction attempt.
// Every extraction produces a status; content is present only on Success.
struct ExtractionResult {
    enum class Status {
        Success,
        UnsupportedFormat,
        SizeExceeded,
        Inaccessible,
        Unknown,
    };

    Status status = Status::Unknown;
    std::optional<QString> content;
    // Heading hierarchy when the format has one (markdown).
    std::optional<DocumentStructure> structure;
    std::optional<QString> errorMessage;
    int durationMs = 0;
};

QString extractionStatusToString(ExtractionResult::Status status);

// FileExtractor: abstract interface for content extraction backends.
// Rich formats (PDF, office, audio) are expected to arrive as
// implementations of this interface wrapping an external converter.
class FileExtractor {
public:
    virtual ~FileExtractor() = default;

    virtual ExtractionResult extract(const QString& filePath) = 0;

    // The extension is lowercase without a leading dot (e.g. "md", "txt").
    virtual bool supports(const QString& extension) const = 0;
};

} // namespace sift
