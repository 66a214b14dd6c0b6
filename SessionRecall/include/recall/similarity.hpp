#pragma once

#include "tfidf.hpp"

namespace recall {

// Cosine of the angle between two sparse vectors. Returns exactly 0 when
// either vector has zero norm. With non-negative weights the result lies in
// [0, 1].
double cosine_similarity(const TermVector& a, const TermVector& b);

} // namespace recall
