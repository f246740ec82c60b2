#include "descriptors.h"
#include "../imgproc.h"
#include <opencv2/imgproc.hpp>

namespace facesig {

FeatureVector extractColorGeometry(const FaceRegion& region) {
    cv::Mat color = asMat(region.color.view());

    const int bins[] = {COLOR_HISTOGRAM_BINS};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    FeatureVector features;
    features.reserve(COLOR_GEOMETRY_LENGTH);

    // B, G, R in memory order
    for (int c = 0; c < 3; c++) {
        const int channels[] = {c};
        cv::Mat hist;
        cv::calcHist(&color, 1, channels, cv::Mat(), hist, 1, bins, ranges);
        for (int b = 0; b < COLOR_HISTOGRAM_BINS; b++) {
            features.push_back(hist.at<float>(b));
        }
    }

    // Crop geometry in source pixels
    const double height = region.rectangle.height;
    const double width = region.rectangle.width;
    features.push_back(height);
    features.push_back(width);
    features.push_back((width > 0.0) ? height / width : 0.0);

    return features;
}

} // namespace facesig
