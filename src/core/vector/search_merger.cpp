#include "core/vector/search_merger.h"

#include <QHash>

#include <algorithm>

namespace sift {

double SearchMerger::rrfContribution(double weight, int rank, int rrfK)
{
    if (rank < 0) {
        return 0.0;
    }
    const int denom = std::max(0, rrfK) + rank + 1;
    return weight / static_cast<double>(denom);
}

std::vector<SearchResult> SearchMerger::fuse(const std::vector<SearchResult>& listA,
                                             const std::vector<SearchResult>& listB,
                                             const FusionConfig& config)
{
    // Slot per distinct chunk id, in first-seen order.
    std::vector<SearchResult> fused;
    std::vector<double> scores;
    QHash<QString, size_t> slotByChunkId;
    fused.reserve(listA.size() + listB.size());
    scores.reserve(listA.size() + listB.size());
    slotByChunkId.reserve(static_cast<qsizetype>(listA.size() + listB.size()));

    auto accumulate = [&](const std::vector<SearchResult>& list, double weight) {
        for (size_t rank = 0; rank < list.size(); ++rank) {
            const SearchResult& result = list[rank];
            const double contribution =
                rrfContribution(weight, static_cast<int>(rank), config.rrfK);

            auto it = slotByChunkId.constFind(result.chunkId);
            if (it == slotByChunkId.constEnd()) {
                slotByChunkId.insert(result.chunkId, fused.size());
                fused.push_back(result);
                scores.push_back(contribution);
            } else {
                scores[it.value()] += contribution;
            }
        }
    };

    accumulate(listA, config.weightA);
    accumulate(listB, config.weightB);

    for (size_t i = 0; i < fused.size(); ++i) {
        fused[i].similarity = scores[i];
    }

    // Ties keep first-seen order.
    std::stable_sort(fused.begin(), fused.end(),
                     [](const SearchResult& lhs, const SearchResult& rhs) {
                         return lhs.similarity > rhs.similarity;
                     });
    return fused;
}

} // namespace sift
