#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

namespace curio {

/**
 * @brief Raised when two vectors of different length are compared
 */
class DimensionMismatch : public std::invalid_argument {
public:
    DimensionMismatch(size_t lhs_size, size_t rhs_size);

    size_t lhs_size() const { return lhs_size_; }
    size_t rhs_size() const { return rhs_size_; }

private:
    size_t lhs_size_;
    size_t rhs_size_;
};

/**
 * @brief Cosine similarity between two embedding vectors
 *
 * Computes dot(a, b) / (|a| * |b|), accumulated in double precision and
 * clamped to [-1, 1]. Returns 0 when either vector has zero norm (including
 * two empty vectors). Symmetric: cosine_similarity(a, b) == cosine_similarity(b, a).
 *
 * @throws DimensionMismatch if a.size() != b.size()
 */
double cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

} // namespace curio
