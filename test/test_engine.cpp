#include "face_engine.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <thread>

using namespace facesig;
using namespace facesig::testing;

namespace {

EngineConfig testConfig() {
    EngineConfig config = EngineConfig::defaults();
    config.detection.cascade_path.clear();
    return config;
}

} // namespace

class FaceEngineTest : public ::testing::Test {
protected:
    BrightBlockDetector detector_;
    FaceEngine engine_{detector_, testConfig()};
};

TEST_F(FaceEngineTest, EncodeProducesNormalizedSignature) {
    Image frame = makeFaceFrame(320, 240, Rect(100, 60, 120, 120));

    EncodeResult r = engine_.encode(frame.view());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.signature.size(), SIGNATURE_LENGTH);
    EXPECT_NEAR(l2Norm(r.signature), 1.0, 1e-9);
    EXPECT_FALSE(r.degenerate);
    EXPECT_EQ(r.face, Rect(100, 60, 120, 120));
    EXPECT_EQ(r.region, Rect(70, 30, 180, 180));
    EXPECT_GT(r.quality.confidence, 0.0);
    EXPECT_LE(r.quality.confidence, MAX_QUALITY_CONFIDENCE);
}

TEST_F(FaceEngineTest, EncodeIsDeterministic) {
    Image frame = makeFaceFrame(320, 240, Rect(90, 50, 100, 110), 3);
    Image copy = frame.clone();

    EncodeResult a = engine_.encode(frame.view());
    EncodeResult b = engine_.encode(copy.view());
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(a.signature, b.signature);
}

TEST_F(FaceEngineTest, GrayscaleFrameAccepted) {
    Image color = makeFaceFrame(200, 200, Rect(50, 50, 100, 100));
    Image gray(200, 200, 1);
    for (int y = 0; y < 200; y++) {
        for (int x = 0; x < 200; x++) {
            gray.at(x, y) = color.at(x, y, 0);
        }
    }

    EncodeResult r = engine_.encode(gray.view());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.signature.size(), SIGNATURE_LENGTH);
}

TEST_F(FaceEngineTest, NoFaceReported) {
    Image frame(200, 200, 3, 50);
    EncodeResult r = engine_.encode(frame.view());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::NO_FACE_DETECTED);
    EXPECT_TRUE(r.signature.empty());
}

TEST_F(FaceEngineTest, InvalidImagesReported) {
    Image rgba(64, 64, 4, 10);
    EncodeResult wrong_channels = engine_.encode(rgba.view());
    EXPECT_FALSE(wrong_channels.success);
    EXPECT_EQ(wrong_channels.error, ErrorCode::INVALID_IMAGE);

    ImageView empty(nullptr, 0, 0, 3);
    EncodeResult no_pixels = engine_.encode(empty);
    EXPECT_FALSE(no_pixels.success);
    EXPECT_EQ(no_pixels.error, ErrorCode::INVALID_IMAGE);
}

TEST_F(FaceEngineTest, CompareAgainstOwnEncodingMatches) {
    Image frame = makeFaceFrame(320, 240, Rect(100, 60, 120, 120));
    EncodeResult enrolled = engine_.encode(frame.view());
    ASSERT_TRUE(enrolled.success);

    MatchResult r = engine_.compare(enrolled.signature, frame.view());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_NEAR(r.distance, 0.0, 1e-12);
    EXPECT_TRUE(r.is_match);
    EXPECT_NEAR(r.confidence_percent, 100.0, 1e-9);
}

TEST_F(FaceEngineTest, CompareWithoutFaceFails) {
    Image blank(200, 200, 3, 50);
    MatchResult r = engine_.compare(Signature(SIGNATURE_LENGTH, 0.01), blank.view());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::NO_FACE_DETECTED);
}

TEST_F(FaceEngineTest, CompareRejectsForeignSchema) {
    Image frame = makeFaceFrame(320, 240, Rect(100, 60, 120, 120));
    MatchResult r = engine_.compare(Signature(128, 0.1), frame.view());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::LENGTH_MISMATCH);
}

TEST_F(FaceEngineTest, CompareTemplate) {
    Image frame = makeFaceFrame(320, 240, Rect(100, 60, 120, 120));
    EncodeResult enrolled = engine_.encode(frame.view());
    ASSERT_TRUE(enrolled.success);

    EnrollmentTemplate tmpl{enrolled.signature, {enrolled.signature}};
    MatchResult r = engine_.compareTemplate(tmpl, frame.view());
    ASSERT_TRUE(r.success);
    EXPECT_NEAR(r.distance, 0.0, 1e-12);
    EXPECT_TRUE(r.is_match);
}

TEST_F(FaceEngineTest, AggregateSkipsFailedSamples) {
    std::vector<EnrollmentSample> samples;
    samples.emplace_back(makeFaceFrame(320, 240, Rect(100, 60, 120, 120), 0));
    samples.emplace_back(Image(320, 240, 3, 50));     // no face
    samples.emplace_back(makeFaceFrame(320, 240, Rect(90, 50, 130, 130), 7));
    samples.emplace_back(makeFaceFrame(320, 240, Rect(110, 70, 110, 110), 13));

    AggregateResult r = engine_.aggregate(samples);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.successful_encodings, 3u);
    EXPECT_EQ(r.failed_encodings, 1u);
    EXPECT_EQ(r.tag, "excellent");
    EXPECT_EQ(r.tmpl.primary.size(), SIGNATURE_LENGTH);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_NE(r.diagnostics[0].find("sample 1"), std::string::npos);
}

TEST_F(FaceEngineTest, AggregateWithNothingUsable) {
    std::vector<EnrollmentSample> samples;
    samples.emplace_back(Image(100, 100, 3, 20));
    samples.emplace_back(Image(100, 100, 3, 30));

    AggregateResult r = engine_.aggregate(samples);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::NO_USABLE_SAMPLES);
    EXPECT_EQ(r.failed_encodings, 2u);
}

TEST_F(FaceEngineTest, AggregateCountsUndecodedSamples) {
    std::vector<EnrollmentSample> samples(1);
    samples[0].decode_error = "Unsupported image format";
    samples.emplace_back(makeFaceFrame(320, 240, Rect(100, 60, 120, 120), 3));

    AggregateResult r = engine_.aggregate(samples);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.successful_encodings, 1u);
    EXPECT_EQ(r.failed_encodings, 1u);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_NE(r.diagnostics[0].find("sample 0"), std::string::npos);
    EXPECT_NE(r.diagnostics[0].find(errorCodeToString(ErrorCode::INVALID_IMAGE)), std::string::npos);
    EXPECT_NE(r.diagnostics[0].find("Unsupported image format"), std::string::npos);
}

TEST(FaceEngineAggregateTest, WorkersBoundedByHardwareConcurrency) {
    InFlightDetector detector;
    EngineConfig config = testConfig();
    config.parallel_extraction = false;
    FaceEngine engine(detector, config);

    std::vector<EnrollmentSample> samples;
    for (int i = 0; i < 48; i++) {
        samples.emplace_back(Image(64, 64, 3, static_cast<uint8_t>(i)));
    }

    AggregateResult r = engine.aggregate(samples);
    EXPECT_EQ(r.error, ErrorCode::NO_USABLE_SAMPLES);
    EXPECT_EQ(r.failed_encodings, samples.size());

    const size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    EXPECT_GE(detector.peak(), 1u);
    EXPECT_LE(detector.peak(), hardware);
}

TEST_F(FaceEngineTest, AssessCaptureWithoutFace) {
    Image frame(200, 200, 3, 50);
    CaptureAssessment a = engine_.assessCapture(frame.view());
    EXPECT_EQ(a.error, ErrorCode::NONE);
    EXPECT_FALSE(a.is_valid);
    EXPECT_EQ(a.face_count, 0);
    EXPECT_EQ(a.message, "No face detected");
}

TEST_F(FaceEngineTest, AssessCaptureSingleFace) {
    Image frame = makeFaceFrame(200, 200, Rect(40, 40, 120, 120));
    CaptureAssessment a = engine_.assessCapture(frame.view());
    EXPECT_EQ(a.error, ErrorCode::NONE);
    EXPECT_EQ(a.face_count, 1);
    EXPECT_GE(a.quality_score, 0.0);
    EXPECT_LE(a.quality_score, 100.0);
}

TEST(FaceEngineCaptureTest, MultipleFacesRejected) {
    FixedDetector detector({Rect(10, 10, 40, 40), Rect(100, 10, 40, 40)});
    EngineConfig config = testConfig();
    FaceEngine engine(detector, config);

    Image frame(200, 120, 3, 100);
    CaptureAssessment a = engine.assessCapture(frame.view());
    EXPECT_FALSE(a.is_valid);
    EXPECT_EQ(a.face_count, 2);
    EXPECT_EQ(a.message, "Multiple faces detected");
}

TEST(FaceEngineCaptureTest, InvalidFrame) {
    FixedDetector detector({Rect(0, 0, 10, 10)});
    FaceEngine engine(detector, testConfig());

    Image rgba(32, 32, 4, 0);
    CaptureAssessment a = engine.assessCapture(rgba.view());
    EXPECT_EQ(a.error, ErrorCode::INVALID_IMAGE);
    EXPECT_FALSE(a.is_valid);
}

TEST(FaceEngineStrictTest, StrictModeSurfacesAmbiguity) {
    FixedDetector detector({Rect(10, 10, 40, 40), Rect(100, 10, 40, 40)});
    EngineConfig config = testConfig();
    config.detection.strict_single_face = true;
    FaceEngine engine(detector, config);

    Image frame(200, 120, 3, 100);
    EncodeResult r = engine.encode(frame.view());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorCode::MULTIPLE_FACES_AMBIGUOUS);
}
