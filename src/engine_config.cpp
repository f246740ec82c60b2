#include "engine_config.h"
#include "config.h"
#include "config_paths.h"
#include "logger.h"
#include <sstream>
#include <cctype>
#include <algorithm>
#include <stdexcept>

namespace facesig {

std::vector<DetectionParams> defaultDetectionTiers() {
    return {
        {1.3, 5, 30},
        {1.1, 3, 20},
        {1.05, 2, 15},
    };
}

EngineConfig EngineConfig::defaults() {
    EngineConfig config;
    config.detection.cascade_path = DEFAULT_CASCADE_PATH;
    config.detection.tiers = defaultDetectionTiers();
    return config;
}

std::optional<std::vector<DetectionParams>> parseDetectionTiers(const std::string& text) {
    std::vector<DetectionParams> tiers;
    std::stringstream list(text);
    std::string item;

    while (std::getline(list, item, ',')) {
        item.erase(std::remove_if(item.begin(), item.end(), ::isspace), item.end());
        if (item.empty()) {
            continue;
        }

        size_t first = item.find(':');
        size_t second = (first == std::string::npos) ? std::string::npos : item.find(':', first + 1);
        if (second == std::string::npos) {
            return std::nullopt;
        }

        DetectionParams params{};
        try {
            params.scale_factor = std::stod(item.substr(0, first));
            params.min_neighbors = std::stoi(item.substr(first + 1, second - first - 1));
            params.min_size = std::stoi(item.substr(second + 1));
        } catch (const std::exception&) {
            return std::nullopt;
        }

        if (params.scale_factor <= 1.0 || params.min_neighbors < 0 || params.min_size < 1) {
            return std::nullopt;
        }
        tiers.push_back(params);
    }

    return tiers;
}

namespace {

// Overwrite `value` only when [section] key parses and lies in [min_val, max_val].
// Ranges mirror Config::validate.
void readDouble(const Config& config, const std::string& section, const std::string& key,
                double min_val, double max_val, double& value) {
    auto raw = config.getString(section, key);
    if (!raw) {
        return;
    }

    auto parsed = config.getDouble(section, key);
    if (!parsed || *parsed < min_val || *parsed > max_val) {
        Logger::getInstance().warning("Ignoring invalid [" + section + "] " + key + " = " + *raw +
                                      ", keeping " + std::to_string(value));
        return;
    }
    value = *parsed;
}

} // namespace

EngineConfig EngineConfig::fromConfig(const Config& config) {
    EngineConfig engine = defaults();
    Logger& log = Logger::getInstance();

    // Detection
    if (auto cascade = config.getString("detection", "cascade")) {
        engine.detection.cascade_path = *cascade;
    }
    if (auto tiers_text = config.getString("detection", "tiers")) {
        auto tiers = parseDetectionTiers(*tiers_text);
        if (!tiers) {
            log.warning("Ignoring malformed [detection] tiers: " + *tiers_text);
        } else if (tiers->size() < 3) {
            log.warning("[detection] tiers needs at least 3 entries, got " +
                        std::to_string(tiers->size()) + "; using defaults");
        } else {
            engine.detection.tiers = *tiers;
        }
    }
    engine.detection.strict_single_face =
        config.getBool("detection", "strict_single_face").value_or(false);

    // Matching
    MatcherSettings& m = engine.matching;
    const MatcherSettings matcher_defaults;
    readDouble(config, "matching", "tolerance", 0.0, 2.0, m.base_tolerance);
    readDouble(config, "matching", "weight_euclidean", 0.0, 1.0, m.weight_euclidean);
    readDouble(config, "matching", "weight_cosine", 0.0, 1.0, m.weight_cosine);
    readDouble(config, "matching", "weight_manhattan", 0.0, 1.0, m.weight_manhattan);
    readDouble(config, "matching", "high_quality_threshold", 0.0, 100.0, m.high_quality_threshold);
    readDouble(config, "matching", "low_quality_threshold", 0.0, 100.0, m.low_quality_threshold);
    readDouble(config, "matching", "high_quality_multiplier", 0.5, 2.0, m.high_quality_multiplier);
    readDouble(config, "matching", "low_quality_multiplier", 0.5, 2.0, m.low_quality_multiplier);
    readDouble(config, "matching", "max_expected_distance", 0.01, 10.0, m.max_expected_distance);
    readDouble(config, "matching", "template_primary_weight", 0.0, 1.0, m.template_primary_weight);

    if (auto policy = config.getString("matching", "length_policy")) {
        std::string lower = *policy;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        if (lower == "truncate") {
            m.length_policy = LengthPolicy::TRUNCATE_TO_SHORTER;
            log.warning("Signature length policy is 'truncate': mismatched schemas will be compared on their common prefix");
        } else if (lower != "reject") {
            log.warning("Unknown [matching] length_policy '" + *policy + "', using reject");
        }
    }

    if (m.weight_euclidean + m.weight_cosine + m.weight_manhattan <= 0.0) {
        log.warning("[matching] weights sum to zero, restoring 0.4/0.4/0.2");
        m.weight_euclidean = matcher_defaults.weight_euclidean;
        m.weight_cosine = matcher_defaults.weight_cosine;
        m.weight_manhattan = matcher_defaults.weight_manhattan;
    }
    if (m.low_quality_threshold > m.high_quality_threshold) {
        log.warning("[matching] low_quality_threshold exceeds high_quality_threshold, restoring 60/80");
        m.low_quality_threshold = matcher_defaults.low_quality_threshold;
        m.high_quality_threshold = matcher_defaults.high_quality_threshold;
    }

    // Quality
    readDouble(config, "quality", "size_gain", 0.1, 1000.0, engine.quality.size_gain);
    readDouble(config, "quality", "clarity_scale", 1.0, 100000.0, engine.quality.clarity_scale);

    engine.parallel_extraction =
        config.getBool("engine", "parallel_extraction").value_or(engine.parallel_extraction);

    return engine;
}

} // namespace facesig
