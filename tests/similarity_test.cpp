#include "recall/similarity.hpp"
#include <gtest/gtest.h>

using namespace recall;

TEST(SimilarityTest, IdenticalVectorsScoreOne) {
    const TermVector v = {{"auth", 1.5}, {"login", 0.7}};
    EXPECT_NEAR(cosine_similarity(v, v), 1.0, 1e-12);
}

TEST(SimilarityTest, DisjointVectorsScoreZero) {
    EXPECT_DOUBLE_EQ(cosine_similarity({{"auth", 1.0}}, {{"billing", 1.0}}), 0.0);
}

TEST(SimilarityTest, EmptyOrZeroVectorsScoreZero) {
    const TermVector v = {{"auth", 1.0}};
    EXPECT_DOUBLE_EQ(cosine_similarity({}, v), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity(v, {}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({{"auth", 0.0}}, v), 0.0);
}

TEST(SimilarityTest, PartialOverlap) {
    const TermVector a = {{"x1", 1.0}, {"y1", 1.0}};
    const TermVector b = {{"x1", 1.0}, {"z1", 1.0}};
    EXPECT_NEAR(cosine_similarity(a, b), 0.5, 1e-12);
}

TEST(SimilarityTest, SymmetricAndBounded) {
    const TermVector a = {{"auth", 2.0}, {"login", 0.5}, {"token", 1.2}};
    const TermVector b = {{"auth", 0.3}, {"token", 4.0}};
    const double ab = cosine_similarity(a, b);
    EXPECT_DOUBLE_EQ(ab, cosine_similarity(b, a));
    EXPECT_GE(ab, 0.0);
    EXPECT_LE(ab, 1.0);
}
