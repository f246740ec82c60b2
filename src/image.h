/*
 * Pixel buffer classes for facesig
 *
 * - ImageView: non-owning view (can't copy, only reference)
 * - Image: owning buffer (move-only, explicit clone), 64-byte aligned
 * - Rect: axis-aligned rectangle in pixel coordinates
 *
 * Color buffers are interleaved BGR (3 channels), grayscale buffers have
 * a single channel. Rows may be padded: always address pixels through
 * stride(), never width() * channels().
 */

#ifndef FACESIG_IMAGE_H
#define FACESIG_IMAGE_H

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <algorithm>
#include <new>

namespace facesig {

class Image;
class ImageView;

// ========== Rect: Bounding Rectangle ==========

struct Rect {
    int x, y, width, height;

    constexpr Rect() noexcept : x(0), y(0), width(0), height(0) {}
    constexpr Rect(int x_, int y_, int w, int h) noexcept
        : x(x_), y(y_), width(w), height(h) {}

    // Intersection with bounds (clip to frame)
    Rect& operator&=(const Rect& bounds) noexcept {
        int x2 = std::min(x + width, bounds.x + bounds.width);
        int y2 = std::min(y + height, bounds.y + bounds.height);
        x = std::max(x, bounds.x);
        y = std::max(y, bounds.y);
        width = std::max(0, x2 - x);
        height = std::max(0, y2 - y);
        return *this;
    }

    constexpr bool operator==(const Rect& o) const noexcept {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }

    constexpr bool empty() const noexcept {
        return width <= 0 || height <= 0;
    }

    constexpr long long area() const noexcept {
        return static_cast<long long>(width) * height;
    }

    constexpr double centerX() const noexcept {
        return x + width / 2.0;
    }

    constexpr double centerY() const noexcept {
        return y + height / 2.0;
    }

    // Grow by `pad` on every side, then clip to a frame of the given size
    Rect paddedWithin(int pad, int frame_width, int frame_height) const noexcept {
        Rect r(x - pad, y - pad, width + 2 * pad, height + 2 * pad);
        r &= Rect(0, 0, frame_width, frame_height);
        return r;
    }
};

// ========== ImageView: Non-Owning View ==========

class ImageView {
public:
    ImageView(const uint8_t* data, int width, int height, int channels, int stride = 0) noexcept
        : data_(data), width_(width), height_(height),
          channels_(channels), stride_(stride > 0 ? stride : width * channels) {}

    // Views can't be copied - forces explicit intent
    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

    ImageView(ImageView&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
    }

    ImageView& operator=(ImageView&& other) noexcept {
        data_ = other.data_;
        width_ = other.width_;
        height_ = other.height_;
        channels_ = other.channels_;
        stride_ = other.stride_;
        other.data_ = nullptr;
        return *this;
    }

    const uint8_t* data() const noexcept { return data_; }
    const uint8_t* row(int y) const noexcept { return data_ + static_cast<size_t>(y) * stride_; }
    uint8_t at(int x, int y, int c = 0) const noexcept { return row(y)[x * channels_ + c]; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ <= 0 || height_ <= 0; }
    constexpr Rect bounds() const noexcept { return Rect(0, 0, width_, height_); }

    // Caller guarantees `rect` lies inside bounds()
    ImageView roi(const Rect& rect) const noexcept {
        return ImageView(data_ + static_cast<size_t>(rect.y) * stride_ + rect.x * channels_,
                         rect.width, rect.height, channels_, stride_);
    }

    // Explicit deep copy (returns owning Image)
    Image clone() const;

private:
    const uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ========== Image: Owning Image (Move-Only) ==========

class Image {
public:
    Image() noexcept
        : data_(nullptr), width_(0), height_(0), channels_(0), stride_(0) {}

    // Allocating constructor (owns data, 64-byte aligned, zero-filled)
    Image(int width, int height, int channels)
        : width_(width), height_(height), channels_(channels),
          stride_(width * channels) {

        if (width <= 0 || height <= 0 || channels <= 0) {
            throw std::invalid_argument("Image dimensions must be positive");
        }

        size_t size = static_cast<size_t>(stride_) * height_;
        size_t aligned_size = (size + 63) & ~static_cast<size_t>(63);

        if (posix_memalign(reinterpret_cast<void**>(&data_), 64, aligned_size) != 0) {
            throw std::bad_alloc();
        }
        std::memset(data_, 0, aligned_size);
    }

    // Filled constructor, handy for synthetic frames
    Image(int width, int height, int channels, uint8_t fill)
        : Image(width, height, channels) {
        std::memset(data_, fill, static_cast<size_t>(stride_) * height_);
    }

    ~Image() noexcept {
        free(data_);
    }

    // Images can't be copied - must use explicit clone()
    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    Image(Image&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
        other.width_ = 0;
        other.height_ = 0;
    }

    Image& operator=(Image&& other) noexcept {
        if (this != &other) {
            free(data_);

            data_ = other.data_;
            width_ = other.width_;
            height_ = other.height_;
            channels_ = other.channels_;
            stride_ = other.stride_;

            other.data_ = nullptr;
            other.width_ = 0;
            other.height_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    uint8_t* row(int y) noexcept { return data_ + static_cast<size_t>(y) * stride_; }
    const uint8_t* row(int y) const noexcept { return data_ + static_cast<size_t>(y) * stride_; }
    uint8_t& at(int x, int y, int c = 0) noexcept { return row(y)[x * channels_ + c]; }
    uint8_t at(int x, int y, int c = 0) const noexcept { return row(y)[x * channels_ + c]; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }
    constexpr size_t size() const noexcept { return static_cast<size_t>(width_) * height_ * channels_; }

    // Non-owning view (view lifetime must be < image lifetime)
    ImageView view() const noexcept {
        return ImageView(data_, width_, height_, channels_, stride_);
    }

    Image clone() const {
        return view().clone();
    }

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ImageView::clone() implementation (needs Image definition)
inline Image ImageView::clone() const {
    if (empty()) {
        return Image();
    }

    Image copy(width_, height_, channels_);

    // Copy row by row (handles stride)
    for (int y = 0; y < height_; y++) {
        std::memcpy(copy.row(y), row(y), static_cast<size_t>(width_) * channels_);
    }

    return copy;
}

} // namespace facesig

#endif // FACESIG_IMAGE_H
