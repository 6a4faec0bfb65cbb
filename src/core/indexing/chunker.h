#pragma once

#include "core/indexing/document_structure.h"
#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace sift {

// Configuration for the Chunker.
// Defined outside the class to avoid the "default member initializer needed
// within enclosing class" issue in C++.
struct ChunkerConfig {
    int chunkSize = 1000;       // Target characters per fixed-size chunk
    int chunkOverlap = 200;     // Characters shared by consecutive fixed-size chunks
    int maxTokens = 512;        // Upper bound on estimateTokenCount() of any chunk
    int minChunkChars = 100;    // Smaller chunks are merged into a neighbour
    bool useSemanticSplitting = true;
};

// Chunker: splits document text into bounded passages for embedding.
//
// With a DocumentStructure, whole paragraphs of one section are packed into a
// chunk (the first chunk of a section starts at its heading line). Without
// one, text is cut into chunkSize windows overlapping by chunkOverlap.
//
// Window split priority (highest to lowest):
//   1. Paragraph boundary (\n\n)
//   2. Sentence boundary (. followed by space, or !  ?, followed by newline)
//   3. Word boundary (space)
//   4. Force character split at the window end
//
// Output is a pure function of (text, structure, config). Chunk ids are left
// empty; they are assigned once the owning document id is known.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Returns an empty vector for empty or whitespace-only text.
    std::vector<Chunk> chunk(const QString& text,
                             const QString& title,
                             const QString& source,
                             const Metadata& metadata,
                             const DocumentStructure* structure = nullptr) const;

    const Config& config() const { return m_config; }

    // Largest window in characters that still satisfies maxTokens.
    int windowSize() const;

private:
    struct Piece {
        TextSpan span;
        QString heading;
        QString headingPath;
        bool semantic = false;
    };

    std::vector<Piece> splitFixed(const QString& text, TextSpan range) const;
    std::vector<Piece> splitSemantic(const QString& text, const DocumentStructure& structure) const;
    std::vector<Piece> mergeSmallPieces(const QString& text, std::vector<Piece> pieces) const;
    bool fitsTokenBudget(const QString& text, int start, int end) const;

    // Find the best split point near targetEnd, searching backward from targetEnd.
    // Returns the index *after* the split (i.e., the start of the next chunk).
    int findSplitPoint(const QString& content, int chunkStart, int targetEnd) const;

    Config m_config;
};

} // namespace sift
