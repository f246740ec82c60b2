#include "descriptors.h"
#include "../imgproc.h"
#include <opencv2/imgproc.hpp>

namespace facesig {

namespace {

constexpr double kBinWidthDegrees = 180.0 / GRADIENT_BINS;

} // namespace

FeatureVector extractGradientHistogram(const FaceRegion& region) {
    cv::Mat gray = asMat(region.gray.view());

    cv::Mat gx, gy;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3, 1.0, 0.0, cv::BORDER_REFLECT_101);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3, 1.0, 0.0, cv::BORDER_REFLECT_101);

    cv::Mat magnitude, angle;
    cv::cartToPolar(gx, gy, magnitude, angle, true);

    FeatureVector histogram(GRADIENT_LENGTH, 0.0);

    for (int y = 0; y < gray.rows; y++) {
        const double* mag = magnitude.ptr<double>(y);
        const double* ang = angle.ptr<double>(y);
        const int cell_row = y / GRADIENT_CELL_SIZE;

        for (int x = 0; x < gray.cols; x++) {
            if (mag[x] == 0.0) {
                continue;
            }

            // Unsigned orientation folded into [0, 180)
            double degrees = ang[x];
            while (degrees >= 180.0) degrees -= 180.0;

            int bin = static_cast<int>(degrees / kBinWidthDegrees);
            if (bin >= GRADIENT_BINS) bin = GRADIENT_BINS - 1;

            const int cell = cell_row * GRADIENT_CELLS_PER_SIDE + x / GRADIENT_CELL_SIZE;
            histogram[static_cast<size_t>(cell) * GRADIENT_BINS + bin] += mag[x];
        }
    }

    return histogram;
}

} // namespace facesig
