#include "signature.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace facesig;
using namespace facesig::testing;

TEST(NormalizeTest, UnitNormAfterNormalization) {
    Signature s = {3.0, 4.0};
    ASSERT_TRUE(normalizeL2(s));
    EXPECT_DOUBLE_EQ(s[0], 0.6);
    EXPECT_DOUBLE_EQ(s[1], 0.8);
    EXPECT_NEAR(l2Norm(s), 1.0, 1e-12);
}

TEST(NormalizeTest, Idempotent) {
    Signature s = {1.0, -2.0, 0.5, 7.0};
    ASSERT_TRUE(normalizeL2(s));
    Signature once = s;
    ASSERT_TRUE(normalizeL2(s));
    for (size_t i = 0; i < s.size(); i++) {
        EXPECT_NEAR(s[i], once[i], 1e-12);
    }
}

TEST(NormalizeTest, ZeroVectorLeftUnchanged) {
    Signature s(10, 0.0);
    EXPECT_FALSE(normalizeL2(s));
    for (double v : s) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(BuildSignatureTest, ConstantLengthAndUnitNorm) {
    for (int seed : {0, 5, 11}) {
        SignatureBuild build = buildSignature(makePatternRegion(seed));
        EXPECT_EQ(build.signature.size(), SIGNATURE_LENGTH);
        EXPECT_FALSE(build.degenerate);
        EXPECT_NEAR(l2Norm(build.signature), 1.0, 1e-9);
    }

    SignatureBuild flat = buildSignature(makeUniformRegion(0));
    EXPECT_EQ(flat.signature.size(), SIGNATURE_LENGTH);
}

TEST(BuildSignatureTest, ParallelMatchesSequential) {
    FaceRegion region = makePatternRegion(4);
    SignatureBuild parallel = buildSignature(region, true);
    SignatureBuild sequential = buildSignature(region, false);
    EXPECT_EQ(parallel.signature, sequential.signature);
}

TEST(BuildSignatureTest, Deterministic) {
    EXPECT_EQ(buildSignature(makePatternRegion(2)).signature,
              buildSignature(makePatternRegion(2)).signature);
}

TEST(BuildSignatureTest, IdenticalUniformRegionsGiveIdenticalSignatures) {
    SignatureBuild a = buildSignature(makeUniformRegion(128));
    SignatureBuild b = buildSignature(makeUniformRegion(128));
    EXPECT_EQ(a.signature, b.signature);

    // The gradient block is all zero for a flat region
    for (size_t i = TEXTURE_BINS; i < TEXTURE_BINS + GRADIENT_LENGTH; i++) {
        EXPECT_EQ(a.signature[i], 0.0);
    }
}

TEST(AverageSignaturesTest, ElementWiseMean) {
    Signature mean = averageSignatures({{1.0, 2.0, 3.0}, {3.0, 4.0, 5.0}});
    ASSERT_EQ(mean.size(), 3u);
    EXPECT_DOUBLE_EQ(mean[0], 2.0);
    EXPECT_DOUBLE_EQ(mean[1], 3.0);
    EXPECT_DOUBLE_EQ(mean[2], 4.0);
}

TEST(AverageSignaturesTest, RaggedOrEmptyInputGivesEmpty) {
    EXPECT_TRUE(averageSignatures({}).empty());
    EXPECT_TRUE(averageSignatures({{1.0, 2.0}, {1.0}}).empty());
}
