#include "core/vector/vector_index.h"
#include "core/index/sqlite_store.h"
#include "core/shared/logging.h"

#include <hnswlib/hnswlib.h>

#include <QDebug>

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>

namespace sift {

VectorIndex::VectorIndex(int dimensions)
    : m_dimensions(dimensions)
{
}

VectorIndex::~VectorIndex()
{
}

bool VectorIndex::create(int initialCapacity)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    return createUnlocked(initialCapacity);
}

bool VectorIndex::createUnlocked(int initialCapacity)
{
    if (m_dimensions <= 0) {
        qCritical() << "VectorIndex::create requires a positive dimension";
        return false;
    }

    try {
        const int capacity = std::max(initialCapacity, 1);
        m_index.reset();
        m_space = std::make_unique<hnswlib::InnerProductSpace>(m_dimensions);
        m_index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            m_space.get(),
            static_cast<size_t>(capacity),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        m_index->setEf(static_cast<size_t>(kEfSearch));
        m_deletedCount = 0;
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::create failed:" << e.what();
        m_index.reset();
        m_space.reset();
        return false;
    }
}

bool VectorIndex::rebuildFrom(SQLiteStore& store)
{
    auto embeddedCount = store.embeddedChunkCount();
    if (!embeddedCount) {
        LOG_ERROR(siftSearch, "VectorIndex rebuild: %s",
                  qUtf8Printable(embeddedCount.error().message));
        return false;
    }

    const int capacity = static_cast<int>(std::min<int64_t>(
        std::max<int64_t>(embeddedCount.value() + kInitialCapacity, kInitialCapacity),
        std::numeric_limits<int>::max()));
    if (!create(capacity)) {
        return false;
    }

    int added = 0;
    int rejected = 0;
    Status status = store.forEachEmbedding([&](int64_t rowId, const Embedding& embedding) {
        if (addVector(static_cast<uint64_t>(rowId), embedding)) {
            ++added;
        } else {
            ++rejected;
        }
    });
    if (!status) {
        LOG_ERROR(siftSearch, "VectorIndex rebuild: %s", qUtf8Printable(status.error().message));
        return false;
    }

    LOG_INFO(siftSearch, "VectorIndex rebuilt with %d vectors (%d rejected)", added, rejected);
    return true;
}

Embedding VectorIndex::normalized(const Embedding& embedding)
{
    double sumSquares = 0.0;
    for (float v : embedding) {
        sumSquares += static_cast<double>(v) * static_cast<double>(v);
    }
    if (sumSquares <= 0.0 || !std::isfinite(sumSquares)) {
        return {};
    }
    const double norm = std::sqrt(sumSquares);
    Embedding out;
    out.reserve(embedding.size());
    for (float v : embedding) {
        out.push_back(static_cast<float>(static_cast<double>(v) / norm));
    }
    return out;
}

bool VectorIndex::addVector(uint64_t label, const Embedding& embedding)
{
    if (static_cast<int>(embedding.size()) != m_dimensions) {
        qWarning() << "VectorIndex::addVector dimension mismatch:" << embedding.size()
                   << "expected" << m_dimensions;
        return false;
    }
    const Embedding unit = normalized(embedding);
    if (unit.empty()) {
        qWarning() << "VectorIndex::addVector rejected zero vector for label" << label;
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::addVector called with unavailable index";
        return false;
    }
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        m_index->addPoint(unit.data(), static_cast<hnswlib::labeltype>(label));
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::addVector failed:" << e.what();
        return false;
    }
}

bool VectorIndex::deleteVector(uint64_t label)
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::deleteVector called with unavailable index";
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        ++m_deletedCount;
        return true;
    } catch (const std::exception& e) {
        // Unknown label: the chunk never had an embedding.
        qDebug() << "VectorIndex::deleteVector skipped label" << label << e.what();
        return false;
    }
}

void VectorIndex::clear()
{
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    createUnlocked(kInitialCapacity);
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const Embedding& query, int k) const
{
    std::vector<KnnResult> results;
    if (k <= 0 || static_cast<int>(query.size()) != m_dimensions) {
        return results;
    }
    const Embedding unit = normalized(query);
    if (unit.empty()) {
        return results;
    }

    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return results;
    }

    const size_t live = m_index->getCurrentElementCount() - static_cast<size_t>(m_deletedCount);
    const size_t wanted = std::min(static_cast<size_t>(k), live);
    if (wanted == 0) {
        return results;
    }

    try {
        // searchKnn widens ef to k on its own; ef is never touched after create().
        auto queue = m_index->searchKnn(unit.data(), wanted);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto entry = queue.top();
            queue.pop();
            results.push_back(KnnResult{static_cast<uint64_t>(entry.second), entry.first});
        }
        std::stable_sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            return a.distance < b.distance;
        });
        return results;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::search failed:" << e.what();
        return {};
    }
}

int VectorIndex::totalElements() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    if (!m_index) {
        return 0;
    }
    return static_cast<int>(m_index->getCurrentElementCount()) - m_deletedCount;
}

int VectorIndex::deletedElements() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_deletedCount;
}

bool VectorIndex::isAvailable() const
{
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_index != nullptr;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (maxElements == 0) {
        qCritical() << "VectorIndex has zero max elements";
        return false;
    }

    const size_t threshold = (maxElements * 8) / 10;
    if (current < threshold) {
        return true;
    }

    const size_t newCapacity = maxElements * 2;
    if (newCapacity <= maxElements) {
        qCritical() << "VectorIndex resize overflow";
        return false;
    }

    try {
        m_index->resizeIndex(newCapacity);
        LOG_DEBUG(siftSearch, "VectorIndex resized to capacity %llu",
                  static_cast<unsigned long long>(newCapacity));
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex resize failed:" << e.what();
        return false;
    }
}

} // namespace sift
