#ifndef FACESIG_ENGINE_CONFIG_H
#define FACESIG_ENGINE_CONFIG_H

#include <string>
#include <vector>
#include <optional>

namespace facesig {

class Config;

// One detector invocation: image pyramid step, neighbor votes, smallest face edge
struct DetectionParams {
    double scale_factor;
    int min_neighbors;
    int min_size;
};

enum class LengthPolicy {
    REJECT,             // mismatched lengths are a LENGTH_MISMATCH failure
    TRUNCATE_TO_SHORTER // compare the common prefix (explicit opt-in)
};

struct MatcherSettings {
    double base_tolerance = 0.25;
    double weight_euclidean = 0.4;
    double weight_cosine = 0.4;
    double weight_manhattan = 0.2;

    // Adaptive tolerance: lenient above high, strict below low
    double high_quality_threshold = 80.0;
    double low_quality_threshold = 60.0;
    double high_quality_multiplier = 1.1;
    double low_quality_multiplier = 0.9;

    double max_expected_distance = 1.0;
    double template_primary_weight = 0.6;
    LengthPolicy length_policy = LengthPolicy::REJECT;
};

struct QualitySettings {
    double size_gain = 20.0;        // faceArea/imageArea multiplier before clamping to 1
    double clarity_scale = 1000.0;  // Laplacian variance that counts as fully sharp
};

struct DetectionSettings {
    std::string cascade_path;
    std::vector<DetectionParams> tiers;
    bool strict_single_face = false;
};

// Immutable engine configuration, built once at startup and passed by
// reference into every engine component.
struct EngineConfig {
    DetectionSettings detection;
    MatcherSettings matching;
    QualitySettings quality;
    bool parallel_extraction = true;

    static EngineConfig defaults();

    // Missing or invalid keys keep their defaults (a warning is logged)
    static EngineConfig fromConfig(const Config& config);
};

// Strict-to-permissive tiers used when configuration does not override them
std::vector<DetectionParams> defaultDetectionTiers();

// Parse "1.3:5:30, 1.1:3:20, 1.05:2:15". Returns nullopt on any malformed tier.
std::optional<std::vector<DetectionParams>> parseDetectionTiers(const std::string& text);

} // namespace facesig

#endif // FACESIG_ENGINE_CONFIG_H
