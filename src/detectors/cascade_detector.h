#ifndef FACESIG_CASCADE_DETECTOR_H
#define FACESIG_CASCADE_DETECTOR_H

#include "detector.h"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace facesig {

// Haar cascade backend (OpenCV frontal-face cascade).
// The classifier is loaded once and shared; detectMultiScale is not
// re-entrant, so concurrent callers are serialized.
class CascadeDetector : public FaceRectDetector {
public:
    CascadeDetector() = default;

    CascadeDetector(const CascadeDetector&) = delete;
    CascadeDetector& operator=(const CascadeDetector&) = delete;

    // Load cascade XML. Returns false (and logs) if the file is missing or invalid.
    bool load(const std::string& cascade_path);

    std::vector<Rect> detect(const ImageView& gray, const DetectionParams& params) override;
    const char* name() const override { return "haar-cascade"; }

private:
    cv::CascadeClassifier classifier_;
    std::mutex mutex_;
    bool loaded_ = false;
};

} // namespace facesig

#endif // FACESIG_CASCADE_DETECTOR_H
