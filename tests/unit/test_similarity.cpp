#include <gtest/gtest.h>
#include "curio/graph/similarity.hpp"

using namespace curio;

// ==========================================
// Cosine Similarity Tests
// ==========================================

TEST(CosineSimilarityTest, IdenticalVectorsAreOne) {
    std::vector<float> v = {0.3f, -1.2f, 4.0f, 0.5f};
    EXPECT_NEAR(cosine_similarity(v, v), 1.0, 1e-9);
}

TEST(CosineSimilarityTest, OppositeVectorsAreMinusOne) {
    std::vector<float> v = {0.3f, -1.2f, 4.0f};
    std::vector<float> neg = {-0.3f, 1.2f, -4.0f};
    EXPECT_NEAR(cosine_similarity(v, neg), -1.0, 1e-9);
}

TEST(CosineSimilarityTest, OrthogonalVectorsAreZero) {
    EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 2.0f}), 0.0, 1e-12);
}

TEST(CosineSimilarityTest, Symmetric) {
    std::vector<float> a = {0.1f, 0.7f, -0.2f, 0.9f};
    std::vector<float> b = {0.5f, -0.3f, 0.8f, 0.1f};
    EXPECT_EQ(cosine_similarity(a, b), cosine_similarity(b, a));
}

TEST(CosineSimilarityTest, ScaleInvariant) {
    std::vector<float> a = {1.0f, 2.0f, 3.0f};
    std::vector<float> scaled = {10.0f, 20.0f, 30.0f};
    EXPECT_NEAR(cosine_similarity(a, scaled), 1.0, 1e-9);
}

TEST(CosineSimilarityTest, DimensionMismatchThrows) {
    std::vector<float> a = {1.0f, 2.0f, 3.0f};
    std::vector<float> b = {1.0f, 2.0f};

    EXPECT_THROW(cosine_similarity(a, b), DimensionMismatch);

    try {
        cosine_similarity(a, b);
        FAIL() << "Expected DimensionMismatch";
    } catch (const DimensionMismatch& e) {
        EXPECT_EQ(e.lhs_size(), 3u);
        EXPECT_EQ(e.rhs_size(), 2u);
    }
}

TEST(CosineSimilarityTest, DimensionMismatchIsInvalidArgument) {
    EXPECT_THROW(cosine_similarity({1.0f}, {}), std::invalid_argument);
}

TEST(CosineSimilarityTest, ZeroNormReturnsZero) {
    std::vector<float> zero = {0.0f, 0.0f, 0.0f};
    std::vector<float> v = {1.0f, 2.0f, 3.0f};
    EXPECT_EQ(cosine_similarity(zero, v), 0.0);
    EXPECT_EQ(cosine_similarity(v, zero), 0.0);
    EXPECT_EQ(cosine_similarity(zero, zero), 0.0);
}

TEST(CosineSimilarityTest, EmptyVectorsReturnZero) {
    EXPECT_EQ(cosine_similarity({}, {}), 0.0);
}

TEST(CosineSimilarityTest, ResultStaysInRange) {
    std::vector<float> a = {1e-20f, 3e20f, -7.0f};
    std::vector<float> b = {2e-20f, 6e20f, -14.0f};
    double s = cosine_similarity(a, b);
    EXPECT_LE(s, 1.0);
    EXPECT_GE(s, -1.0);
}

TEST(CosineSimilarityTest, ScenarioPairs) {
    std::vector<float> a = {1.0f, 0.0f, 0.0f, 0.0f};
    std::vector<float> b = {0.9f, 0.435890f, 0.0f, 0.0f};
    std::vector<float> c = {0.3f, 0.0f, 0.953939f, 0.0f};
    std::vector<float> d = {0.285f, 0.0f, 0.906242f, 0.312250f};

    EXPECT_NEAR(cosine_similarity(a, b), 0.9, 1e-4);
    EXPECT_NEAR(cosine_similarity(c, d), 0.95, 1e-4);
    EXPECT_NEAR(cosine_similarity(a, c), 0.3, 1e-4);
    EXPECT_LT(cosine_similarity(a, d), 0.5);
    EXPECT_LT(cosine_similarity(b, c), 0.5);
    EXPECT_LT(cosine_similarity(b, d), 0.5);
}
