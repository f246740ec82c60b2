#include "descriptors.h"

namespace facesig {

const std::array<Descriptor, DESCRIPTOR_COUNT>& descriptorSet() {
    static const std::array<Descriptor, DESCRIPTOR_COUNT> set = {{
        {DescriptorKind::TEXTURE, "texture", TEXTURE_BINS, extractTextureHistogram},
        {DescriptorKind::GRADIENT, "gradient", GRADIENT_LENGTH, extractGradientHistogram},
        {DescriptorKind::FREQUENCY, "frequency", FREQUENCY_LENGTH,
            [](const FaceRegion& region) {
                return extractFrequencyResponses(region, FilterBank::getInstance());
            }},
        {DescriptorKind::REGIONAL, "regional", REGIONAL_LENGTH, extractRegionalStatistics},
        {DescriptorKind::COLOR_GEOMETRY, "color_geometry", COLOR_GEOMETRY_LENGTH, extractColorGeometry},
    }};
    return set;
}

} // namespace facesig
