#include "core/indexing/document_structure.h"

namespace sift {

namespace {

struct Line {
    int start = 0;
    int end = 0;   // Excludes the newline
};

std::vector<Line> splitLines(const QString& text)
{
    std::vector<Line> lines;
    int start = 0;
    const int len = static_cast<int>(text.size());
    for (int i = 0; i < len; ++i) {
        if (text[i] == QLatin1Char('\n')) {
            lines.push_back({start, i});
            start = i + 1;
        }
    }
    if (start < len) {
        lines.push_back({start, len});
    }
    return lines;
}

bool isFence(const QString& trimmedLine)
{
    return trimmedLine.startsWith(QStringLiteral("```"))
        || trimmedLine.startsWith(QStringLiteral("~~~"));
}

} // namespace

std::optional<QString> MarkdownStructureParser::headingText(const QString& line, int* level)
{
    // Up to three spaces of indentation are allowed before the hashes.
    int pos = 0;
    while (pos < line.size() && pos < 3 && line[pos] == QLatin1Char(' ')) {
        ++pos;
    }
    int hashes = 0;
    while (pos + hashes < line.size() && line[pos + hashes] == QLatin1Char('#')) {
        ++hashes;
    }
    if (hashes < 1 || hashes > 6) {
        return std::nullopt;
    }
    const int afterHashes = pos + hashes;
    if (afterHashes < line.size()
        && line[afterHashes] != QLatin1Char(' ')
        && line[afterHashes] != QLatin1Char('\t')) {
        return std::nullopt;
    }

    QString heading = line.mid(afterHashes).trimmed();
    // Optional closing sequence: "## Title ##"
    while (heading.endsWith(QLatin1Char('#'))) {
        heading.chop(1);
    }
    heading = heading.trimmed();
    if (heading.isEmpty()) {
        return std::nullopt;
    }
    if (level) {
        *level = hashes;
    }
    return heading;
}

std::optional<DocumentStructure> MarkdownStructureParser::parse(const QString& text)
{
    DocumentStructure structure;
    structure.textLength = static_cast<int>(text.size());

    std::vector<QString> pathStack;  // index = level - 1
    DocumentSection current;
    bool sawHeading = false;
    bool inFence = false;
    std::optional<TextSpan> paragraph;

    auto closeParagraph = [&]() {
        if (paragraph) {
            current.paragraphs.push_back(*paragraph);
            paragraph.reset();
        }
    };
    auto closeSection = [&]() {
        closeParagraph();
        if (current.headingSpan || !current.paragraphs.empty()) {
            structure.sections.push_back(std::move(current));
        }
        current = DocumentSection{};
    };

    for (const Line& line : splitLines(text)) {
        const QString raw = text.mid(line.start, line.end - line.start);
        const QString trimmed = raw.trimmed();

        if (isFence(trimmed)) {
            inFence = !inFence;
        } else if (!inFence) {
            int level = 0;
            if (auto heading = headingText(raw, &level)) {
                closeSection();
                sawHeading = true;

                pathStack.resize(static_cast<size_t>(level - 1));
                pathStack.push_back(*heading);

                current.heading = *heading;
                current.level = level;
                for (const QString& part : pathStack) {
                    if (!part.isEmpty()) {
                        current.headingPath.append(part);
                    }
                }
                current.headingSpan = TextSpan{line.start, line.end};
                continue;
            }
            if (trimmed.isEmpty()) {
                closeParagraph();
                continue;
            }
        }

        if (paragraph) {
            paragraph->end = line.end;
        } else {
            paragraph = TextSpan{line.start, line.end};
        }
    }
    closeSection();

    if (!sawHeading) {
        return std::nullopt;
    }
    return structure;
}

} // namespace sift
