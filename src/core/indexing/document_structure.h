#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace sift {

// Half-open character range [start, end) into the source text.
struct TextSpan {
    int start = 0;
    int end = 0;

    int length() const { return end - start; }
};

struct DocumentSection {
    QString heading;            // Empty for text before the first heading
    int level = 0;              // 1..6 for ATX headings, 0 for the preamble
    QStringList headingPath;    // Ancestor headings followed by this one
    std::optional<TextSpan> headingSpan;
    std::vector<TextSpan> paragraphs;
};

// Hierarchical view of a document used for semantic chunking. All spans
// index into the exact text the structure was parsed from.
struct DocumentStructure {
    std::vector<DocumentSection> sections;
    int textLength = 0;
};

// MarkdownStructureParser: ATX headings (# .. ######) and blank-line
// separated paragraphs. Fenced code blocks are kept whole and headings
// inside them are ignored.
class MarkdownStructureParser {
public:
    // Returns nullopt when the text carries no headings.
    static std::optional<DocumentStructure> parse(const QString& text);

    // Heading text if `line` is an ATX heading, with its level in `level`.
    static std::optional<QString> headingText(const QString& line, int* level = nullptr);
};

} // namespace sift
