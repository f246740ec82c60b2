#include "cascade_detector.h"
#include "../imgproc.h"
#include "../logger.h"
#include <opencv2/core.hpp>

namespace facesig {

bool CascadeDetector::load(const std::string& cascade_path) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loaded_ = classifier_.load(cascade_path);
    } catch (const cv::Exception& e) {
        Logger::getInstance().error("OpenCV failed to parse cascade " + cascade_path + ": " + e.what());
        loaded_ = false;
    }

    if (!loaded_) {
        Logger::getInstance().error("Failed to load face cascade: " + cascade_path);
        return false;
    }

    Logger::getInstance().debug("Loaded face cascade: " + cascade_path);
    return true;
}

std::vector<Rect> CascadeDetector::detect(const ImageView& gray, const DetectionParams& params) {
    if (!loaded_ || gray.empty() || gray.channels() != 1) {
        return {};
    }

    cv::Mat frame = asMat(gray);

    std::vector<cv::Rect> faces;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            classifier_.detectMultiScale(frame, faces, params.scale_factor, params.min_neighbors, 0,
                                         cv::Size(params.min_size, params.min_size));
        } catch (const cv::Exception& e) {
            Logger::getInstance().error(std::string("detectMultiScale failed: ") + e.what());
            return {};
        }
    }

    std::vector<Rect> result;
    result.reserve(faces.size());
    for (const auto& f : faces) {
        result.emplace_back(f.x, f.y, f.width, f.height);
    }
    return result;
}

} // namespace facesig
