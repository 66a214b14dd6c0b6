#include "../include/recall/selection.hpp"

#include <algorithm>

namespace recall {

std::vector<ScoredSession> select_relevant(const std::vector<ScoredSession>& ranking, const SelectionPolicy& policy) {
    std::vector<ScoredSession> selected;
    for (const auto& entry : ranking) {
        if (selected.size() >= policy.max_results) {
            break;
        }
        if (entry.score >= policy.min_score) {
            selected.push_back(entry);
        }
    }

    if (selected.empty()) {
        const std::size_t count = std::min(policy.fallback_results, ranking.size());
        selected.assign(ranking.begin(), ranking.begin() + static_cast<std::ptrdiff_t>(count));
    }
    return selected;
}

} // namespace recall
