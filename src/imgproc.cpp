#include "imgproc.h"
#include <libyuv.h>
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

namespace facesig {

cv::Mat asMat(const ImageView& view) {
    return cv::Mat(view.height(), view.width(), CV_8UC(view.channels()),
                   const_cast<uint8_t*>(view.data()), static_cast<size_t>(view.stride()));
}

Image toGrayscale(const ImageView& frame) {
    if (frame.channels() == 1) {
        return frame.clone();
    }
    if (frame.channels() != 3) {
        throw std::invalid_argument("toGrayscale expects 1 or 3 channels, got " +
                                    std::to_string(frame.channels()));
    }

    Image gray(frame.width(), frame.height(), 1);

    // libyuv's RGB24 is B,G,R in memory; J400 is full-range grayscale
    libyuv::RGB24ToJ400(frame.data(), frame.stride(), gray.data(), gray.stride(),
                        frame.width(), frame.height());
    return gray;
}

Image resizeGray(const ImageView& gray, int dst_width, int dst_height) {
    Image dst(dst_width, dst_height, 1);
    libyuv::ScalePlane(gray.data(), gray.stride(), gray.width(), gray.height(),
                       dst.data(), dst.stride(), dst_width, dst_height,
                       libyuv::kFilterBilinear);
    return dst;
}

Image resizeColor(const ImageView& bgr, int dst_width, int dst_height) {
    // libyuv scales packed 24-bit only via ARGB
    Image src_argb(bgr.width(), bgr.height(), 4);
    libyuv::RGB24ToARGB(bgr.data(), bgr.stride(), src_argb.data(), src_argb.stride(),
                        bgr.width(), bgr.height());

    Image dst_argb(dst_width, dst_height, 4);
    libyuv::ARGBScale(
        src_argb.data(), src_argb.stride(),
        src_argb.width(), src_argb.height(),
        dst_argb.data(), dst_argb.stride(),
        dst_argb.width(), dst_argb.height(),
        libyuv::kFilterBilinear
    );

    Image result(dst_width, dst_height, 3);
    libyuv::ARGBToRGB24(dst_argb.data(), dst_argb.stride(), result.data(), result.stride(),
                        dst_width, dst_height);
    return result;
}

Image rgbToBgr(const ImageView& rgb) {
    // RAW is R,G,B in memory; RGB24 is B,G,R
    Image bgr(rgb.width(), rgb.height(), 3);
    libyuv::RAWToRGB24(rgb.data(), rgb.stride(), bgr.data(), bgr.stride(),
                       rgb.width(), rgb.height());
    return bgr;
}

double laplacianVariance(const ImageView& gray) {
    if (gray.empty()) {
        return 0.0;
    }

    // ksize 1 is the [0 1 0; 1 -4 1; 0 1 0] aperture
    cv::Mat laplacian;
    cv::Laplacian(asMat(gray), laplacian, CV_64F, 1, 1.0, 0.0, cv::BORDER_REFLECT_101);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return stddev[0] * stddev[0];
}

} // namespace facesig
