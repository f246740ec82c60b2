#include "filter_bank.h"
#include "../signature_layout.h"
#include <opencv2/imgproc.hpp>
#include <cmath>

namespace facesig {

namespace {

// Orientations in degrees and wavelengths in pixels (0.25 and 0.125 cycles/pixel)
constexpr double kOrientations[GABOR_ORIENTATIONS] = {0.0, 45.0, 90.0, 135.0};
constexpr double kWavelengths[GABOR_FREQUENCIES] = {4.0, 8.0};

// Spatial aspect ratio and sigma/lambda ratio (about one octave bandwidth)
constexpr double kGamma = 0.5;
constexpr double kSigmaPerWavelength = 0.56;

} // namespace

const FilterBank& FilterBank::getInstance() {
    static const FilterBank instance;
    return instance;
}

FilterBank::FilterBank() {
    kernels_.reserve(GABOR_ORIENTATIONS * GABOR_FREQUENCIES);
    for (double theta : kOrientations) {
        for (double lambda : kWavelengths) {
            kernels_.push_back(makeKernel(theta, lambda));
        }
    }
}

GaborKernel FilterBank::makeKernel(double theta_degrees, double wavelength) {
    GaborKernel kernel;
    kernel.theta_degrees = theta_degrees;
    kernel.wavelength = wavelength;

    const double sigma = kSigmaPerWavelength * wavelength;
    const int size = 2 * static_cast<int>(std::ceil(3.0 * sigma)) + 1;

    // Even (cosine) carrier, psi = 0
    kernel.weights = cv::getGaborKernel(cv::Size(size, size), sigma, theta_degrees * CV_PI / 180.0,
                                        wavelength, kGamma, 0.0, CV_64F);

    // Remove the DC term so flat regions respond with zero
    kernel.weights -= cv::mean(kernel.weights)[0];
    const double l1 = cv::norm(kernel.weights, cv::NORM_L1);
    if (l1 > 0.0) {
        kernel.weights /= l1;
    }

    return kernel;
}

} // namespace facesig
