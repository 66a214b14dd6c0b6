#pragma once

#include "session.hpp"

#include <cstddef>
#include <vector>

namespace recall {

struct SelectionPolicy {
    double min_score = 0.1;
    std::size_t max_results = 5;
    // Entries returned regardless of score when nothing clears min_score.
    std::size_t fallback_results = 3;
};

// Caller-side trimming of a ranking: keeps entries scoring at least
// min_score, capped to max_results. When that leaves nothing, the first
// fallback_results entries are returned instead.
std::vector<ScoredSession> select_relevant(const std::vector<ScoredSession>& ranking, const SelectionPolicy& policy);

} // namespace recall
