#ifndef FACESIG_DETECTOR_H
#define FACESIG_DETECTOR_H

#include "../image.h"
#include "../engine_config.h"
#include <vector>

namespace facesig {

// Face rectangle detector collaborator.
// Given a grayscale frame and one parameter tier, returns zero or more
// axis-aligned candidates in frame coordinates, in the detector's own order.
// Implementations must not keep references to the frame after returning.
class FaceRectDetector {
public:
    virtual ~FaceRectDetector() = default;

    virtual std::vector<Rect> detect(const ImageView& gray, const DetectionParams& params) = 0;

    // Short backend name for logs
    virtual const char* name() const = 0;
};

} // namespace facesig

#endif // FACESIG_DETECTOR_H
