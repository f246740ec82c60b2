#ifndef FACESIG_FILTER_BANK_H
#define FACESIG_FILTER_BANK_H

#include <opencv2/core.hpp>
#include <vector>

namespace facesig {

// Real-valued Gabor kernel (CV_64F), zero mean, L1-normalized, odd square size
struct GaborKernel {
    double theta_degrees;
    double wavelength;
    cv::Mat weights;

    int size() const { return weights.rows; }
};

// Oriented band-pass filters shared by every extraction.
// Built once on first use and never modified afterwards.
class FilterBank {
public:
    static const FilterBank& getInstance();

    const std::vector<GaborKernel>& kernels() const { return kernels_; }

    static GaborKernel makeKernel(double theta_degrees, double wavelength);

private:
    FilterBank();
    FilterBank(const FilterBank&) = delete;
    FilterBank& operator=(const FilterBank&) = delete;

    std::vector<GaborKernel> kernels_;
};

} // namespace facesig

#endif // FACESIG_FILTER_BANK_H
