#ifndef FACESIG_SIGNATURE_LAYOUT_H
#define FACESIG_SIGNATURE_LAYOUT_H

#include <cstddef>

namespace facesig {

// ============================================================================
// SIGNATURE LAYOUT - COMPILE-TIME SCHEMA
// ============================================================================
// Every face is resampled to a CANONICAL_FACE_SIZE square before descriptors
// run, so each descriptor has a fixed output length and the signature length
// is a constant of the build. Signatures produced by builds with a different
// layout must never be compared (the matcher rejects length mismatches).
//
// Block order inside a signature:
//   [texture 256][gradient 2304][frequency 16][regional R][color+geometry 99]
//
// Regional block:
//   default                 2x2 quadrants x (mean, stddev, max, min) = 16
//   FACESIG_REGION_BANDS    eye / nose / mouth bands x 32-bin histogram = 96
// ============================================================================

constexpr int CANONICAL_FACE_SIZE = 128;

constexpr size_t TEXTURE_BINS = 256;

constexpr int GRADIENT_CELL_SIZE = 8;
constexpr int GRADIENT_BINS = 9;
constexpr int GRADIENT_CELLS_PER_SIDE = CANONICAL_FACE_SIZE / GRADIENT_CELL_SIZE;
constexpr size_t GRADIENT_LENGTH =
    static_cast<size_t>(GRADIENT_BINS) * GRADIENT_CELLS_PER_SIDE * GRADIENT_CELLS_PER_SIDE;

constexpr int GABOR_ORIENTATIONS = 4;
constexpr int GABOR_FREQUENCIES = 2;
constexpr size_t FREQUENCY_LENGTH = GABOR_ORIENTATIONS * GABOR_FREQUENCIES * 2;

#ifdef FACESIG_REGION_BANDS
constexpr int REGION_COUNT = 3;
constexpr int REGION_HISTOGRAM_BINS = 32;
constexpr size_t REGIONAL_LENGTH = REGION_COUNT * REGION_HISTOGRAM_BINS;
#else
constexpr int REGION_COUNT = 4;
constexpr size_t REGIONAL_LENGTH = REGION_COUNT * 4;
#endif

constexpr int COLOR_HISTOGRAM_BINS = 32;
constexpr size_t COLOR_GEOMETRY_LENGTH = 3 * COLOR_HISTOGRAM_BINS + 3;

constexpr size_t SIGNATURE_LENGTH =
    TEXTURE_BINS + GRADIENT_LENGTH + FREQUENCY_LENGTH + REGIONAL_LENGTH + COLOR_GEOMETRY_LENGTH;

static_assert(CANONICAL_FACE_SIZE % GRADIENT_CELL_SIZE == 0,
              "gradient cells must tile the canonical face");

} // namespace facesig

#endif // FACESIG_SIGNATURE_LAYOUT_H
