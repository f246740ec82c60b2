#ifndef FACESIG_IMGPROC_H
#define FACESIG_IMGPROC_H

#include "image.h"
#include <opencv2/core.hpp>

namespace facesig {

// Wrap an 8-bit view as a cv::Mat without copying. The Mat aliases the
// view's buffer and must not outlive it; callers only read through it.
cv::Mat asMat(const ImageView& view);

// BGR (3 channels) to full-range luma. Single-channel input is copied.
Image toGrayscale(const ImageView& frame);

// Bilinear resampling of a single-channel plane
Image resizeGray(const ImageView& gray, int dst_width, int dst_height);

// Bilinear resampling of a BGR frame
Image resizeColor(const ImageView& bgr, int dst_width, int dst_height);

// RGB -> BGR channel order (for decoders that only emit RGB)
Image rgbToBgr(const ImageView& rgb);

// Variance of the 4-neighbour Laplacian response, reflected border (sharpness measure)
double laplacianVariance(const ImageView& gray);

} // namespace facesig

#endif // FACESIG_IMGPROC_H
