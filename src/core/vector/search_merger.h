#pragma once

#include "core/shared/search_result.h"

#include <vector>

namespace sift {

struct FusionConfig {
    int rrfK = 60;
    double weightA = 0.6;
    double weightB = 0.4;
};

// SearchMerger: Reciprocal Rank Fusion of two ranked lists.
//
// A result at 0-based rank r contributes weight / (k + r + 1). Chunks present
// in both lists sum their contributions and keep the SearchResult seen first
// (list A is scanned before list B). The output similarity is the fused score
// and is only comparable to other fused scores.
class SearchMerger {
public:
    static std::vector<SearchResult> fuse(const std::vector<SearchResult>& listA,
                                          const std::vector<SearchResult>& listB,
                                          const FusionConfig& config = {});

    static double rrfContribution(double weight, int rank, int rrfK);
};

} // namespace sift
