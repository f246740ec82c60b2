#include "descriptors.h"
#include "../imgproc.h"
#include <opencv2/imgproc.hpp>

namespace facesig {

#ifdef FACESIG_REGION_BANDS

// Eye band (top third), nose band (middle third, centre half of the width),
// mouth band (bottom third); 32-bin intensity histogram each
FeatureVector extractRegionalStatistics(const FaceRegion& region) {
    cv::Mat gray = asMat(region.gray.view());
    const int w = gray.cols;
    const int h = gray.rows;

    const cv::Rect bands[REGION_COUNT] = {
        cv::Rect(0, 0, w, h / 3),
        cv::Rect(w / 4, h / 3, w / 2, 2 * h / 3 - h / 3),
        cv::Rect(0, 2 * h / 3, w, h - 2 * h / 3),
    };

    const int channels[] = {0};
    const int bins[] = {REGION_HISTOGRAM_BINS};
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};

    FeatureVector features;
    features.reserve(REGIONAL_LENGTH);
    for (const cv::Rect& band : bands) {
        cv::Mat roi = gray(band);
        cv::Mat hist;
        cv::calcHist(&roi, 1, channels, cv::Mat(), hist, 1, bins, ranges);
        for (int b = 0; b < REGION_HISTOGRAM_BINS; b++) {
            features.push_back(hist.at<float>(b));
        }
    }
    return features;
}

#else

FeatureVector extractRegionalStatistics(const FaceRegion& region) {
    cv::Mat gray = asMat(region.gray.view());
    const int half_w = gray.cols / 2;
    const int half_h = gray.rows / 2;

    // Top-left, top-right, bottom-left, bottom-right
    const cv::Rect quadrants[REGION_COUNT] = {
        cv::Rect(0, 0, half_w, half_h),
        cv::Rect(half_w, 0, gray.cols - half_w, half_h),
        cv::Rect(0, half_h, half_w, gray.rows - half_h),
        cv::Rect(half_w, half_h, gray.cols - half_w, gray.rows - half_h),
    };

    FeatureVector features;
    features.reserve(REGIONAL_LENGTH);

    for (const cv::Rect& q : quadrants) {
        cv::Mat roi = gray(q);

        cv::Scalar mean, stddev;
        cv::meanStdDev(roi, mean, stddev);
        double lo = 0.0;
        double hi = 0.0;
        cv::minMaxLoc(roi, &lo, &hi);

        features.push_back(mean[0]);
        features.push_back(stddev[0]);
        features.push_back(hi);
        features.push_back(lo);
    }

    return features;
}

#endif

} // namespace facesig
