#include "core/indexing/chunker.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace sift {

namespace {

const QString kHeadingPathSeparator = QStringLiteral(" > ");

bool spansFitText(const DocumentStructure& structure, int textLength)
{
    if (structure.textLength != textLength) {
        return false;
    }
    auto inRange = [textLength](const TextSpan& span) {
        return span.start >= 0 && span.start <= span.end && span.end <= textLength;
    };
    for (const DocumentSection& section : structure.sections) {
        if (section.headingSpan && !inRange(*section.headingSpan)) {
            return false;
        }
        for (const TextSpan& paragraph : section.paragraphs) {
            if (!inRange(paragraph)) {
                return false;
            }
        }
    }
    return true;
}

bool splitsSurrogatePair(const QString& text, int i)
{
    return i > 0 && i < text.size() && text[i - 1].isHighSurrogate()
        && text[i].isLowSurrogate();
}

// Moves a cut that falls inside a surrogate pair to the pair's start, or past
// the pair when that would leave nothing after floor.
int snapToCharBoundary(const QString& text, int i, int floor)
{
    if (!splitsSurrogatePair(text, i)) {
        return i;
    }
    return i - 1 > floor ? i - 1 : i + 1;
}

} // namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    // Sanity-check config bounds
    m_config.maxTokens = std::max(1, m_config.maxTokens);
    m_config.chunkSize = std::max(1, m_config.chunkSize);
    m_config.minChunkChars = std::max(0, m_config.minChunkChars);
    const int window = windowSize();
    if (m_config.chunkOverlap < 0) {
        m_config.chunkOverlap = 0;
    }
    if (m_config.chunkOverlap >= window) {
        m_config.chunkOverlap = window / 2;
    }
}

int Chunker::windowSize() const
{
    return std::min(m_config.chunkSize, m_config.maxTokens * 4);
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunk(const QString& text,
                                  const QString& title,
                                  const QString& source,
                                  const Metadata& metadata,
                                  const DocumentStructure* structure) const
{
    std::vector<Chunk> chunks;

    if (text.trimmed().isEmpty()) {
        return chunks;
    }

    const int textLength = static_cast<int>(text.size());
    std::vector<Piece> pieces;
    if (m_config.useSemanticSplitting && structure && !structure->sections.empty()) {
        if (spansFitText(*structure, textLength)) {
            pieces = splitSemantic(text, *structure);
        } else {
            LOG_WARN(siftIndex, "Structure of %s does not match its text; using fixed splitting",
                     qUtf8Printable(source));
        }
    }
    if (pieces.empty()) {
        pieces = splitFixed(text, TextSpan{0, textLength});
    }
    pieces = mergeSmallPieces(text, std::move(pieces));

    int chunkIndex = 0;
    for (const Piece& piece : pieces) {
        const QString content = text.mid(piece.span.start, piece.span.length()).trimmed();
        if (content.isEmpty()) {
            continue;
        }

        Chunk c;
        c.chunkIndex = chunkIndex++;
        c.content = content;
        c.tokenCount = estimateTokenCount(content);

        c.metadata = metadata;
        c.metadata.insert(MetadataKeys::Title, title);
        c.metadata.insert(MetadataKeys::Source, source);
        c.metadata.insert(MetadataKeys::ChunkMethod,
                          piece.semantic ? QStringLiteral("semantic") : QStringLiteral("fixed"));
        c.metadata.insert(MetadataKeys::CharStart, piece.span.start);
        c.metadata.insert(MetadataKeys::CharEnd, piece.span.end);
        if (!piece.heading.isEmpty()) {
            c.metadata.insert(MetadataKeys::Heading, piece.heading);
            c.metadata.insert(MetadataKeys::HeadingPath, piece.headingPath);
        }

        chunks.push_back(std::move(c));
    }

    LOG_DEBUG(siftIndex, "Chunked %s: %d chunks from %d chars",
              qUtf8Printable(source),
              static_cast<int>(chunks.size()),
              textLength);

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

std::vector<Chunker::Piece> Chunker::splitFixed(const QString& text, TextSpan range) const
{
    std::vector<Piece> pieces;
    const int window = windowSize();
    int pos = range.start;

    while (pos < range.end) {
        int chunkEnd;
        if (range.end - pos <= window) {
            // Remaining text fits the window; take it all
            chunkEnd = range.end;
        } else {
            chunkEnd = findSplitPoint(text, pos, pos + window);
        }

        Piece piece;
        piece.span = TextSpan{pos, chunkEnd};
        pieces.push_back(piece);

        if (chunkEnd >= range.end) {
            break;
        }

        // Step back by the overlap, then forward to the next word start so
        // the following chunk does not open mid-word.
        int next = std::max(chunkEnd - m_config.chunkOverlap, pos + 1);
        next = snapToCharBoundary(text, next, pos);
        if (next < chunkEnd && next > range.start && !text[next - 1].isSpace()) {
            int scan = next;
            while (scan < chunkEnd && !text[scan - 1].isSpace()) {
                ++scan;
            }
            if (scan < chunkEnd) {
                next = scan;
            }
        }
        pos = next;
    }

    return pieces;
}

std::vector<Chunker::Piece> Chunker::splitSemantic(const QString& text,
                                                   const DocumentStructure& structure) const
{
    std::vector<Piece> pieces;
    const int window = windowSize();

    for (const DocumentSection& section : structure.sections) {
        const QString headingPath = section.headingPath.join(kHeadingPathSeparator);

        std::vector<TextSpan> units;
        if (section.headingSpan) {
            units.push_back(*section.headingSpan);
        }
        units.insert(units.end(), section.paragraphs.begin(), section.paragraphs.end());

        std::optional<TextSpan> buffer;
        auto flush = [&]() {
            if (buffer) {
                Piece piece;
                piece.span = *buffer;
                piece.heading = section.heading;
                piece.headingPath = headingPath;
                piece.semantic = true;
                pieces.push_back(piece);
                buffer.reset();
            }
        };

        for (const TextSpan& unit : units) {
            if (unit.length() > window) {
                // Oversize paragraph: cut it with the fixed-size splitter.
                flush();
                for (Piece piece : splitFixed(text, unit)) {
                    piece.heading = section.heading;
                    piece.headingPath = headingPath;
                    pieces.push_back(piece);
                }
                continue;
            }
            if (buffer && unit.end - buffer->start > window) {
                flush();
            }
            if (buffer) {
                buffer->end = unit.end;
            } else {
                buffer = unit;
            }
        }
        flush();
    }

    return pieces;
}

std::vector<Chunker::Piece> Chunker::mergeSmallPieces(const QString& text,
                                                      std::vector<Piece> pieces) const
{
    std::vector<Piece> merged;
    merged.reserve(pieces.size());

    auto trimmedLength = [&text](const TextSpan& span) {
        return static_cast<int>(text.mid(span.start, span.length()).trimmed().size());
    };

    for (size_t i = 0; i < pieces.size(); ++i) {
        Piece& piece = pieces[i];
        if (trimmedLength(piece.span) < m_config.minChunkChars) {
            if (!merged.empty()
                && fitsTokenBudget(text, merged.back().span.start, piece.span.end)) {
                merged.back().span.end = std::max(merged.back().span.end, piece.span.end);
                continue;
            }
            if (i + 1 < pieces.size()
                && fitsTokenBudget(text, piece.span.start, pieces[i + 1].span.end)) {
                // First (or unmergeable-backward) piece: fold into the next one.
                pieces[i + 1].span.start = std::min(piece.span.start, pieces[i + 1].span.start);
                continue;
            }
        }
        merged.push_back(piece);
    }

    return merged;
}

bool Chunker::fitsTokenBudget(const QString& text, int start, int end) const
{
    const QString candidate = text.mid(start, end - start).trimmed();
    return estimateTokenCount(candidate) <= m_config.maxTokens;
}

int Chunker::findSplitPoint(const QString& content, int chunkStart, int targetEnd) const
{
    // Search backward from targetEnd toward the middle of the window for
    // the best boundary. We try each boundary type in priority order.

    int searchFloor = chunkStart + (targetEnd - chunkStart) / 2;
    if (searchFloor >= targetEnd) {
        searchFloor = chunkStart;
    }

    // 1. Paragraph boundary: \n\n
    for (int i = targetEnd; i > searchFloor; --i) {
        if (i >= 2 && content[i - 1] == QLatin1Char('\n')
            && content[i - 2] == QLatin1Char('\n')) {
            return i;
        }
    }

    // 2. Sentence boundary: ". " or "!\n" or "?\n"
    for (int i = targetEnd; i > searchFloor; --i) {
        const QChar prev = content[i - 1];
        const QChar curr = (i < content.size()) ? content[i] : QLatin1Char('\0');

        if (prev == QLatin1Char('.') && curr == QLatin1Char(' ')) {
            return i;
        }
        if ((prev == QLatin1Char('!') || prev == QLatin1Char('?'))
            && (curr == QLatin1Char('\n') || curr == QLatin1Char(' '))) {
            return i;
        }
    }

    // 3. Word boundary: space
    for (int i = targetEnd; i > searchFloor; --i) {
        if (content[i - 1] == QLatin1Char(' ')) {
            return i;
        }
    }

    // 4. No good boundary found: force split at targetEnd, never between
    // the halves of a surrogate pair.
    return snapToCharBoundary(content, targetEnd, chunkStart);
}

} // namespace sift
