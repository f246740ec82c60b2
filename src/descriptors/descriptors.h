#ifndef FACESIG_DESCRIPTORS_H
#define FACESIG_DESCRIPTORS_H

#include "../face_region.h"
#include "../signature_layout.h"
#include "filter_bank.h"
#include <array>
#include <functional>
#include <vector>

namespace facesig {

using FeatureVector = std::vector<double>;

// Each extractor is a pure function of the canonical face region.
// None of them mutates the region, so they may run concurrently.

// Local binary pattern histogram over the grayscale sample (1-pixel border
// skipped). Bit k of a code is set when ring neighbour k >= centre; neighbours
// run clockwise from the top-left. Raw counts, TEXTURE_BINS long.
FeatureVector extractTextureHistogram(const FaceRegion& region);

// Magnitude-weighted unsigned orientation histograms (Sobel 3x3, reflected
// border) per GRADIENT_CELL_SIZE cell, cells in row-major order.
FeatureVector extractGradientHistogram(const FaceRegion& region);

// (mean, stddev) of every Gabor response in `bank`, orientation-major.
FeatureVector extractFrequencyResponses(const FaceRegion& region, const FilterBank& bank);

// Quadrant statistics (mean, stddev, max, min), or eye/nose/mouth band
// histograms when built with FACESIG_REGION_BANDS.
FeatureVector extractRegionalStatistics(const FaceRegion& region);

// 32-bin histogram per color channel (B, G, R) followed by crop height,
// crop width and height/width.
FeatureVector extractColorGeometry(const FaceRegion& region);

enum class DescriptorKind {
    TEXTURE,
    GRADIENT,
    FREQUENCY,
    REGIONAL,
    COLOR_GEOMETRY
};

struct Descriptor {
    DescriptorKind kind;
    const char* name;
    size_t length;
    std::function<FeatureVector(const FaceRegion&)> extract;
};

constexpr size_t DESCRIPTOR_COUNT = 5;

// Closed set of descriptors in canonical signature order
const std::array<Descriptor, DESCRIPTOR_COUNT>& descriptorSet();

} // namespace facesig

#endif // FACESIG_DESCRIPTORS_H
