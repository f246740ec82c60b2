#include "quality.h"
#include "imgproc.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace facesig {

QualityScore estimateQuality(const Rect& face, int image_width, int image_height,
                             const ImageView& face_gray, const QualitySettings& settings) {
    QualityScore q;

    const double image_area = static_cast<double>(image_width) * image_height;
    if (image_area <= 0.0) {
        return q;
    }

    q.size_score = std::min(1.0, static_cast<double>(face.area()) / image_area * settings.size_gain);
    q.clarity_score = std::min(1.0, laplacianVariance(face_gray) / settings.clarity_scale);

    // Distance to the frame centre relative to the centre-to-corner distance
    const double dx = face.centerX() - image_width / 2.0;
    const double dy = face.centerY() - image_height / 2.0;
    const double max_distance = std::hypot(image_width / 2.0, image_height / 2.0);
    q.centering_score = std::max(0.0, 1.0 - std::hypot(dx, dy) / max_distance);

    q.confidence = std::min(MAX_QUALITY_CONFIDENCE,
        (q.size_score * 0.4 + q.clarity_score * 0.4 + q.centering_score * 0.2) * 100.0);
    return q;
}

CaptureAssessment assessCapture(const Rect& face, int image_width, int image_height,
                                const ImageView& face_crop) {
    CaptureAssessment a;
    a.face_count = 1;

    double sum = 0.0;
    for (int y = 0; y < face_crop.height(); y++) {
        const uint8_t* row = face_crop.row(y);
        for (int x = 0; x < face_crop.width(); x++) {
            sum += row[x];
        }
    }
    const double pixels = static_cast<double>(face_crop.width()) * face_crop.height();
    const double mean = pixels > 0.0 ? sum / pixels : 0.0;

    // Optimal brightness is mid-gray; 0.78 maps the full deviation to ~0
    a.brightness = std::clamp(100.0 - std::abs(mean - 128.0) * 0.78, 0.0, 100.0);
    a.sharpness = std::min(100.0, laplacianVariance(face_crop) / 10.0);

    const double image_area = static_cast<double>(image_width) * image_height;
    const double ratio = image_area > 0.0 ? static_cast<double>(face.area()) / image_area : 0.0;
    a.face_size = std::min(100.0, ratio * 2000.0);

    a.quality_score = a.brightness * 0.3 + a.sharpness * 0.4 + a.face_size * 0.3;
    a.is_valid = a.brightness > 40.0 && a.sharpness > 30.0 && a.face_size > 20.0 && a.quality_score > 50.0;

    if (a.is_valid) {
        a.message = "High-quality face image suitable for registration";
    } else {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "Image quality issues detected (Brightness: " << a.brightness
           << ", Sharpness: " << a.sharpness
           << ", Size: " << a.face_size << ")";
        a.message = ss.str();
    }
    return a;
}

} // namespace facesig
