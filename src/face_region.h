#ifndef FACESIG_FACE_REGION_H
#define FACESIG_FACE_REGION_H

#include "image.h"
#include "errors.h"
#include "engine_config.h"
#include "detectors/detector.h"
#include <string>
#include <vector>

namespace facesig {

// Canonical face sample every descriptor reads from.
// gray is CANONICAL_FACE_SIZE^2 x 1, color is CANONICAL_FACE_SIZE^2 x 3 (BGR).
struct FaceRegion {
    Rect rectangle;     // padded + clamped crop in source coordinates
    Image gray;
    Image color;
};

struct RegionSelection {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;

    std::vector<Rect> candidates;   // clipped output of the tier that fired
    int tiers_tried = 0;
    Rect face;                      // winning candidate, before padding
    FaceRegion region;
};

class RegionSelector {
public:
    RegionSelector(FaceRectDetector& detector, const DetectionSettings& settings);

    // Run the detection tiers in order until one yields a candidate.
    // Candidates are clipped to the frame; empty ones are dropped.
    std::vector<Rect> detectCandidates(const ImageView& gray, int* tiers_tried = nullptr) const;

    // Full pipeline: detect, pick the largest face, pad, crop, resample.
    // `frame` is the BGR source, `gray` its grayscale conversion.
    RegionSelection select(const ImageView& frame, const ImageView& gray) const;

    // Index of the largest-area rectangle; ties go to the earliest one.
    // Requires a non-empty list.
    static size_t pickLargest(const std::vector<Rect>& candidates);

    static int paddingFor(const Rect& face);

    // Pad `face`, clamp to the frame, crop both buffers, resample to the canonical size
    static FaceRegion extractRegion(const ImageView& frame, const ImageView& gray, const Rect& face);

private:
    FaceRectDetector& detector_;
    DetectionSettings settings_;
};

} // namespace facesig

#endif // FACESIG_FACE_REGION_H
