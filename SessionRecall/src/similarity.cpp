#include "../include/recall/similarity.hpp"

#include <algorithm>
#include <cmath>

namespace recall {

namespace {

double squared_norm(const TermVector& vec) {
    double sum = 0.0;
    for (const auto& entry : vec) {
        sum += entry.second * entry.second;
    }
    return sum;
}

} // namespace

double cosine_similarity(const TermVector& a, const TermVector& b) {
    const double norm_a = squared_norm(a);
    const double norm_b = squared_norm(b);
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    // Keys present in only one vector contribute nothing to the dot product.
    const TermVector& smaller = a.size() <= b.size() ? a : b;
    const TermVector& larger = a.size() <= b.size() ? b : a;
    double dot = 0.0;
    for (const auto& [token, weight] : smaller) {
        const auto it = larger.find(token);
        if (it != larger.end()) {
            dot += weight * it->second;
        }
    }

    const double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return std::min(similarity, 1.0);
}

} // namespace recall
