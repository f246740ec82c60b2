#ifndef FACESIG_QUALITY_H
#define FACESIG_QUALITY_H

#include "image.h"
#include "engine_config.h"
#include "errors.h"
#include <string>

namespace facesig {

// Capture-quality confidence used to adapt the match tolerance.
// Advisory only: a low score never prevents a signature from being built.
struct QualityScore {
    double size_score = 0.0;        // [0,1]
    double clarity_score = 0.0;     // [0,1]
    double centering_score = 0.0;   // [0,1]
    double confidence = 0.0;        // [0,95]
};

constexpr double MAX_QUALITY_CONFIDENCE = 95.0;

// face: winning detector rectangle; face_gray: canonical grayscale sample
QualityScore estimateQuality(const Rect& face, int image_width, int image_height,
                             const ImageView& face_gray, const QualitySettings& settings);

// Registration gate for a single detected face
struct CaptureAssessment {
    ErrorCode error = ErrorCode::NONE;  // set only when the frame itself is unusable
    bool is_valid = false;
    std::string message;
    int face_count = 0;
    double quality_score = 0.0;     // [0,100]
    double brightness = 0.0;        // [0,100]
    double sharpness = 0.0;         // [0,100]
    double face_size = 0.0;         // [0,100]
};

// face_crop: unresized grayscale crop of `face` from the source frame
CaptureAssessment assessCapture(const Rect& face, int image_width, int image_height,
                                const ImageView& face_crop);

} // namespace facesig

#endif // FACESIG_QUALITY_H
