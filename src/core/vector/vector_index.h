#pragma once

#include "core/shared/chunk.h"

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace sift {

class SQLiteStore;

// VectorIndex: in-memory HNSW index over L2-normalized chunk embeddings.
// Labels are chunk row ids from SQLiteStore. Inner product of normalized
// vectors is cosine similarity; hnswlib reports distance = 1 - dot.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float distance = 0.0f;   // cosine distance
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    explicit VectorIndex(int dimensions);
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    bool create(int initialCapacity = kInitialCapacity);

    // Drop everything and load every stored embedding.
    bool rebuildFrom(SQLiteStore& store);

    // Embedding must have dimensions() elements and non-zero norm.
    bool addVector(uint64_t label, const Embedding& embedding);
    bool deleteVector(uint64_t label);
    void clear();

    // Nearest k labels by cosine distance, ascending.
    std::vector<KnnResult> search(const Embedding& query, int k) const;

    int totalElements() const;
    int deletedElements() const;
    bool isAvailable() const;
    int dimensions() const { return m_dimensions; }

    // Copy of `embedding` scaled to unit length; empty for a zero vector.
    static Embedding normalized(const Embedding& embedding);

private:
    bool createUnlocked(int initialCapacity);
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    int m_deletedCount = 0;
    mutable std::shared_mutex m_mutex;
};

} // namespace sift
