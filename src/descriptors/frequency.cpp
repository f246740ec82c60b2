#include "descriptors.h"
#include "../imgproc.h"
#include <opencv2/imgproc.hpp>

namespace facesig {

FeatureVector extractFrequencyResponses(const FaceRegion& region, const FilterBank& bank) {
    cv::Mat gray = asMat(region.gray.view());

    FeatureVector features;
    features.reserve(bank.kernels().size() * 2);

    cv::Mat response;
    for (const auto& kernel : bank.kernels()) {
        cv::filter2D(gray, response, CV_64F, kernel.weights, cv::Point(-1, -1), 0.0,
                     cv::BORDER_REFLECT_101);

        cv::Scalar mean, stddev;
        cv::meanStdDev(response, mean, stddev);
        features.push_back(mean[0]);
        features.push_back(stddev[0]);
    }

    return features;
}

} // namespace facesig
