#ifndef FACESIG_TEST_HELPERS_H
#define FACESIG_TEST_HELPERS_H

#include "face_region.h"
#include "detectors/detector.h"
#include "signature_layout.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace facesig {
namespace testing {

// Canonical region filled with one value (gray and all color channels)
inline FaceRegion makeUniformRegion(uint8_t value, Rect rectangle = Rect(0, 0, 128, 128)) {
    FaceRegion region;
    region.rectangle = rectangle;
    region.gray = Image(CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE, 1, value);
    region.color = Image(CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE, 3, value);
    return region;
}

// Deterministic textured region
inline FaceRegion makePatternRegion(int seed) {
    FaceRegion region;
    region.rectangle = Rect(10, 20, 90, 110);
    region.gray = Image(CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE, 1);
    region.color = Image(CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE, 3);
    for (int y = 0; y < CANONICAL_FACE_SIZE; y++) {
        for (int x = 0; x < CANONICAL_FACE_SIZE; x++) {
            uint8_t v = static_cast<uint8_t>((x * 7 + y * 13 + seed * 31 + (x * y) % 17) % 256);
            region.gray.at(x, y) = v;
            region.color.at(x, y, 0) = v;
            region.color.at(x, y, 1) = static_cast<uint8_t>(255 - v);
            region.color.at(x, y, 2) = static_cast<uint8_t>((v + 64) % 256);
        }
    }
    return region;
}

// BGR frame: dim textured background with a bright textured block standing in for a face
inline Image makeFaceFrame(int width, int height, const Rect& face, int seed = 0) {
    Image frame(width, height, 3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            bool inside = x >= face.x && x < face.x + face.width &&
                          y >= face.y && y < face.y + face.height;
            uint8_t v = inside
                ? static_cast<uint8_t>(205 + (x * 7 + y * 13 + seed) % 50)
                : static_cast<uint8_t>(40 + (x * 3 + y * 5 + seed) % 100);
            frame.at(x, y, 0) = v;
            frame.at(x, y, 1) = v;
            frame.at(x, y, 2) = v;
        }
    }
    return frame;
}

// Returns the same candidates for every tier
class FixedDetector : public FaceRectDetector {
public:
    explicit FixedDetector(std::vector<Rect> rects = {}) : rects_(std::move(rects)) {}

    std::vector<Rect> detect(const ImageView&, const DetectionParams&) override {
        return rects_;
    }
    const char* name() const override { return "fixed"; }

private:
    std::vector<Rect> rects_;
};

// Answers tier i with script[i] (empty once the script runs out) and records the parameters
class ScriptedDetector : public FaceRectDetector {
public:
    explicit ScriptedDetector(std::vector<std::vector<Rect>> script) : script_(std::move(script)) {}

    std::vector<Rect> detect(const ImageView&, const DetectionParams& params) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t call = calls_.size();
        calls_.push_back(params);
        return call < script_.size() ? script_[call] : std::vector<Rect>{};
    }
    const char* name() const override { return "scripted"; }

    const std::vector<DetectionParams>& calls() const { return calls_; }

private:
    std::vector<std::vector<Rect>> script_;
    std::vector<DetectionParams> calls_;
    std::mutex mutex_;
};

// Bounding box of all pixels >= 200 (stateless, safe from several threads)
// Finds nothing; records the largest number of detect() calls in flight at once
class InFlightDetector : public FaceRectDetector {
public:
    std::vector<Rect> detect(const ImageView&, const DetectionParams&) override {
        size_t now = ++in_flight_;
        size_t seen = peak_.load();
        while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        --in_flight_;
        return {};
    }
    const char* name() const override { return "in-flight"; }

    size_t peak() const { return peak_.load(); }

private:
    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> peak_{0};
};

class BrightBlockDetector : public FaceRectDetector {
public:
    std::vector<Rect> detect(const ImageView& gray, const DetectionParams&) override {
        int x0 = gray.width(), y0 = gray.height(), x1 = -1, y1 = -1;
        for (int y = 0; y < gray.height(); y++) {
            for (int x = 0; x < gray.width(); x++) {
                if (gray.at(x, y) >= 200) {
                    x0 = std::min(x0, x);
                    y0 = std::min(y0, y);
                    x1 = std::max(x1, x);
                    y1 = std::max(y1, y);
                }
            }
        }
        if (x1 < 0) {
            return {};
        }
        return {Rect(x0, y0, x1 - x0 + 1, y1 - y0 + 1)};
    }
    const char* name() const override { return "bright-block"; }
};

} // namespace testing
} // namespace facesig

#endif // FACESIG_TEST_HELPERS_H
