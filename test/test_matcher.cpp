#include "matcher.h"
#include "signature.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <cmath>

using namespace facesig;
using namespace facesig::testing;

namespace {

Signature unitSignature(int seed) {
    return buildSignature(makePatternRegion(seed)).signature;
}

} // namespace

TEST(MatcherTest, SelfCompareIsZeroAndMatches) {
    Matcher matcher{MatcherSettings()};
    Signature s = unitSignature(1);

    MatchResult r = matcher.match(s, s, 70.0);
    ASSERT_TRUE(r.success);
    EXPECT_NEAR(r.distance, 0.0, 1e-12);
    EXPECT_TRUE(r.is_match);
    EXPECT_NEAR(r.confidence_percent, 100.0, 1e-9);
    EXPECT_EQ(r.compared_length, SIGNATURE_LENGTH);
}

TEST(MatcherTest, ComponentsAreSymmetric) {
    Signature a = unitSignature(1);
    Signature b = unitSignature(7);

    DistanceComponents ab = Matcher::computeComponents(a, b, a.size());
    DistanceComponents ba = Matcher::computeComponents(b, a, a.size());
    EXPECT_DOUBLE_EQ(ab.euclidean, ba.euclidean);
    EXPECT_DOUBLE_EQ(ab.manhattan, ba.manhattan);
    EXPECT_NEAR(ab.cosine, ba.cosine, 1e-15);
}

TEST(MatcherTest, ComponentFormulas) {
    Signature a = {1.0, 0.0};
    Signature b = {0.0, 1.0};

    DistanceComponents c = Matcher::computeComponents(a, b, 2);
    EXPECT_DOUBLE_EQ(c.euclidean, std::sqrt(2.0) / std::sqrt(2.0));
    EXPECT_DOUBLE_EQ(c.cosine, 1.0);
    EXPECT_DOUBLE_EQ(c.manhattan, 1.0);

    Matcher matcher{MatcherSettings()};
    EXPECT_DOUBLE_EQ(matcher.combine(c), 0.4 * 1.0 + 0.4 * 1.0 + 0.2 * 1.0);
}

TEST(MatcherTest, ZeroNormGivesMaximalCosineDistance) {
    Signature zero(4, 0.0);
    Signature other = {0.5, 0.5, 0.5, 0.5};

    EXPECT_DOUBLE_EQ(Matcher::computeComponents(zero, other, 4).cosine, 1.0);
    EXPECT_DOUBLE_EQ(Matcher::computeComponents(zero, zero, 4).cosine, 1.0);
}

TEST(MatcherTest, LengthMismatchRejectedByDefault) {
    Matcher matcher{MatcherSettings()};
    MatchResult r = matcher.match({1.0, 0.0, 0.0}, {1.0, 0.0}, 70.0);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::LENGTH_MISMATCH);
    EXPECT_FALSE(r.is_match);
}

TEST(MatcherTest, TruncateToShorterIsOptIn) {
    MatcherSettings settings;
    settings.length_policy = LengthPolicy::TRUNCATE_TO_SHORTER;
    Matcher matcher(settings);

    MatchResult r = matcher.match({1.0, 0.0, 9.0}, {1.0, 0.0}, 70.0);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.compared_length, 2u);
    EXPECT_NEAR(r.distance, 0.0, 1e-12);
}

TEST(MatcherTest, EmptySignaturesRejected) {
    MatcherSettings settings;
    settings.length_policy = LengthPolicy::TRUNCATE_TO_SHORTER;
    Matcher matcher(settings);

    MatchResult r = matcher.match({}, {1.0}, 70.0);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::LENGTH_MISMATCH);
}

TEST(MatcherTest, AdaptiveTolerance) {
    Matcher matcher{MatcherSettings()};
    EXPECT_DOUBLE_EQ(matcher.adaptiveTolerance(0.5, 90.0), 0.5 * 1.1);
    EXPECT_DOUBLE_EQ(matcher.adaptiveTolerance(0.5, 50.0), 0.5 * 0.9);
    EXPECT_DOUBLE_EQ(matcher.adaptiveTolerance(0.5, 70.0), 0.5);
    // Thresholds themselves are neutral
    EXPECT_DOUBLE_EQ(matcher.adaptiveTolerance(0.5, 80.0), 0.5);
    EXPECT_DOUBLE_EQ(matcher.adaptiveTolerance(0.5, 60.0), 0.5);
}

TEST(MatcherTest, ExplicitToleranceOverridesBase) {
    Matcher matcher{MatcherSettings()};
    Signature a = unitSignature(1);
    Signature b = unitSignature(8);

    MatchResult strict = matcher.match(a, b, 70.0, 0.0);
    EXPECT_DOUBLE_EQ(strict.tolerance, 0.0);
    EXPECT_FALSE(strict.is_match);

    MatchResult lenient = matcher.match(a, b, 90.0, 5.0);
    EXPECT_DOUBLE_EQ(lenient.tolerance, 5.0 * 1.1);
    EXPECT_TRUE(lenient.is_match);
}

TEST(MatcherTest, ConfidencePercentClampedAndMonotonic) {
    Matcher matcher{MatcherSettings()};
    EXPECT_DOUBLE_EQ(matcher.confidencePercent(0.0), 100.0);
    EXPECT_DOUBLE_EQ(matcher.confidencePercent(0.25), 75.0);
    EXPECT_DOUBLE_EQ(matcher.confidencePercent(1.0), 0.0);
    EXPECT_DOUBLE_EQ(matcher.confidencePercent(3.0), 0.0);

    double previous = 101.0;
    for (double d = 0.0; d <= 1.5; d += 0.05) {
        double c = matcher.confidencePercent(d);
        EXPECT_LE(c, previous);
        EXPECT_GE(c, 0.0);
        previous = c;
    }
}

TEST(MatcherTest, BlackVersusWhiteDoesNotMatch) {
    Signature black = buildSignature(makeUniformRegion(0)).signature;
    Signature white = buildSignature(makeUniformRegion(255)).signature;

    Matcher matcher{MatcherSettings()};
    MatchResult r = matcher.match(black, white, 70.0);
    ASSERT_TRUE(r.success);
    EXPECT_GT(r.distance, MatcherSettings().base_tolerance);
    EXPECT_FALSE(r.is_match);
    // The color histograms are disjoint, so the cosine term dominates
    EXPECT_GT(r.components.cosine, 0.5);

    // Only the color and regional blocks differ, which bounds the blend near 0.31.
    // A caller-supplied tolerance above that bound accepts the pair.
    EXPECT_LT(r.distance, 0.41);
    MatchResult lenient = matcher.match(black, white, 70.0, 1.0);
    ASSERT_TRUE(lenient.success);
    EXPECT_TRUE(lenient.is_match);
}

TEST(MatcherTest, CustomWeights) {
    MatcherSettings settings;
    settings.weight_euclidean = 0.0;
    settings.weight_cosine = 1.0;
    settings.weight_manhattan = 0.0;
    Matcher matcher(settings);

    Signature a = unitSignature(2);
    Signature b = unitSignature(3);
    MatchResult r = matcher.match(a, b, 70.0);
    EXPECT_DOUBLE_EQ(r.distance, r.components.cosine);
}

TEST(MatcherTemplateTest, PrimaryOnlyWhenNoSamples) {
    Matcher matcher{MatcherSettings()};
    Signature a = unitSignature(1);
    Signature b = unitSignature(6);

    EnrollmentTemplate tmpl{a, {}};
    MatchResult t = matcher.matchTemplate(tmpl, b, 70.0);
    MatchResult plain = matcher.match(a, b, 70.0);
    ASSERT_TRUE(t.success);
    EXPECT_DOUBLE_EQ(t.distance, plain.distance);
}

TEST(MatcherTemplateTest, BlendsPrimaryWithClosestSample) {
    Matcher matcher{MatcherSettings()};
    Signature primary = unitSignature(1);
    Signature probe = unitSignature(2);
    Signature far_sample = unitSignature(9);

    EnrollmentTemplate tmpl{primary, {far_sample, probe}};
    MatchResult r = matcher.matchTemplate(tmpl, probe, 70.0);
    ASSERT_TRUE(r.success);

    double d_primary = matcher.match(primary, probe, 70.0).distance;
    EXPECT_NEAR(r.distance, 0.6 * d_primary + 0.4 * 0.0, 1e-12);
}

TEST(MatcherTemplateTest, SampleLengthMismatchFails) {
    Matcher matcher{MatcherSettings()};
    EnrollmentTemplate tmpl{{1.0, 0.0}, {{1.0, 0.0, 0.0}}};
    MatchResult r = matcher.matchTemplate(tmpl, {1.0, 0.0}, 70.0);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::LENGTH_MISMATCH);
}
