#pragma once

#include <vector>

namespace artscan::model {

using Embedding = std::vector<float>;

// 1 - cosine similarity, in [0, 2]. Throws std::invalid_argument on a
// dimension mismatch; a zero vector is maximally distant from everything.
double CosineDistance(const Embedding& a, const Embedding& b);

double L2Norm(const Embedding& v);

// Scales v to unit length. Returns false (and leaves v untouched) for a
// zero or non-finite vector.
bool Normalize(Embedding& v);

} // namespace artscan::model
