#include "curio/graph/similarity.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace curio {

DimensionMismatch::DimensionMismatch(size_t lhs_size, size_t rhs_size)
    : std::invalid_argument(
          "Vectors must have the same length (" + std::to_string(lhs_size) +
          " vs " + std::to_string(rhs_size) + ")"),
      lhs_size_(lhs_size),
      rhs_size_(rhs_size) {}

double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }

    double dot_product = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot_product += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    double similarity = dot_product / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return std::clamp(similarity, -1.0, 1.0);
}

} // namespace curio
