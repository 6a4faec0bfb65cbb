#pragma once

#include "core/shared/types.h"

#include <QString>
#include <optional>
#include <vector>

namespace sift {

using Embedding = std::vector<float>;

struct Chunk {
    QString id;                       // Assigned when the owning document is written
    QString documentId;
    QString content;
    std::optional<Embedding> embedding;
    int chunkIndex = 0;               // 0-based, contiguous within a document
    std::optional<int> tokenCount;
    Metadata metadata;
};

// Compute stable chunk ID: SHA-256 of "documentId#chunkIndex"
QString computeChunkId(const QString& documentId, int chunkIndex);

// Token estimate used for chunk bounds: one token per four characters, rounded up.
int estimateTokenCount(const QString& text);

} // namespace sift
