#ifndef FACESIG_FACE_ENGINE_H
#define FACESIG_FACE_ENGINE_H

#include "engine_config.h"
#include "face_region.h"
#include "signature.h"
#include "quality.h"
#include "matcher.h"
#include "aggregator.h"
#include "errors.h"
#include <optional>
#include <utility>
#include <string>
#include <vector>

namespace facesig {

struct EncodeResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;

    Signature signature;
    bool degenerate = false;    // DEGENERATE_SIGNATURE warning, still a success
    Rect face;                  // detector rectangle
    Rect region;                // padded crop the descriptors saw
    QualityScore quality;
};

// One enrollment input. An empty frame is a failed sample; decode_error,
// when set, says why it could not be decoded.
struct EnrollmentSample {
    Image frame;
    std::string decode_error;

    EnrollmentSample() = default;
    explicit EnrollmentSample(Image f) : frame(std::move(f)) {}
};

// Entry point for the three engine operations. The detector is shared and
// must outlive the engine; the configuration is copied and never changes.
class FaceEngine {
public:
    FaceEngine(FaceRectDetector& detector, const EngineConfig& config);

    // `frame` is a BGR (3 channel) or grayscale (1 channel) buffer
    EncodeResult encode(const ImageView& frame) const;

    MatchResult compare(const Signature& stored, const ImageView& probe,
                        std::optional<double> tolerance = std::nullopt) const;

    MatchResult compareTemplate(const EnrollmentTemplate& enrolled, const ImageView& probe,
                                std::optional<double> tolerance = std::nullopt) const;

    // Encode each sample independently and average the accepted signatures.
    // Samples are spread over at most hardware_concurrency() workers.
    AggregateResult aggregate(const std::vector<EnrollmentSample>& samples) const;

    // Registration gate: exactly one face with acceptable brightness, sharpness and size
    CaptureAssessment assessCapture(const ImageView& frame) const;

    const EngineConfig& config() const { return config_; }
    const Matcher& matcher() const { return matcher_; }

private:
    static bool validFrame(const ImageView& frame, std::string& message);
    SampleOutcome encodeSample(const EnrollmentSample& sample) const;

    EngineConfig config_;
    RegionSelector selector_;
    Matcher matcher_;
};

} // namespace facesig

#endif // FACESIG_FACE_ENGINE_H
