#include "descriptors.h"

namespace facesig {

FeatureVector extractTextureHistogram(const FaceRegion& region) {
    FeatureVector histogram(TEXTURE_BINS, 0.0);
    const Image& gray = region.gray;

    // Ring neighbours clockwise from top-left; index = bit position
    static constexpr int dx[8] = {-1, 0, 1, 1, 1, 0, -1, -1};
    static constexpr int dy[8] = {-1, -1, -1, 0, 1, 1, 1, 0};

    for (int y = 1; y < gray.height() - 1; y++) {
        for (int x = 1; x < gray.width() - 1; x++) {
            const uint8_t center = gray.at(x, y);
            unsigned code = 0;
            for (int k = 0; k < 8; k++) {
                if (gray.at(x + dx[k], y + dy[k]) >= center) {
                    code |= 1u << k;
                }
            }
            histogram[code] += 1.0;
        }
    }

    return histogram;
}

} // namespace facesig
