#include "config.h"
#include "logger.h"
#include <fstream>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace facesig {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void Config::clear() {
    data_.clear();
    validation_errors_.clear();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    clear();

    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            data_[current_section][key] = value;
        }
    }

    bool valid = validate();

    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s):");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }

    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        if (consumed != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        double parsed = std::stod(*value, &consumed);
        if (consumed != value->size() || !std::isfinite(parsed)) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }

    return std::nullopt;
}

bool Config::validateInt(const std::string& section, const std::string& key, int min_val, int max_val) {
    if (!getString(section, key)) {
        return true;  // Optional value, not set
    }

    auto value = getInt(section, key);
    if (!value) {
        validation_errors_.push_back("[" + section + "]." + key + " is not an integer");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateDouble(const std::string& section, const std::string& key, double min_val, double max_val) {
    if (!getString(section, key)) {
        return true;
    }

    auto value = getDouble(section, key);
    if (!value) {
        validation_errors_.push_back("[" + section + "]." + key + " is not a number");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateChoice(const std::string& section, const std::string& key,
                            const std::vector<std::string>& choices) {
    auto value = getString(section, key);
    if (!value) {
        return true;
    }

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (std::find(choices.begin(), choices.end(), lower) != choices.end()) {
        return true;
    }

    std::string joined;
    for (const auto& choice : choices) {
        if (!joined.empty()) joined += ", ";
        joined += choice;
    }
    validation_errors_.push_back("[" + section + "]." + key + " = " + *value +
                                 " must be one of: " + joined);
    return false;
}

bool Config::validate() {
    bool all_valid = true;

    // Matching
    all_valid &= validateDouble("matching", "tolerance", 0.0, 2.0);
    all_valid &= validateDouble("matching", "weight_euclidean", 0.0, 1.0);
    all_valid &= validateDouble("matching", "weight_cosine", 0.0, 1.0);
    all_valid &= validateDouble("matching", "weight_manhattan", 0.0, 1.0);
    all_valid &= validateDouble("matching", "high_quality_threshold", 0.0, 100.0);
    all_valid &= validateDouble("matching", "low_quality_threshold", 0.0, 100.0);
    all_valid &= validateDouble("matching", "high_quality_multiplier", 0.5, 2.0);
    all_valid &= validateDouble("matching", "low_quality_multiplier", 0.5, 2.0);
    all_valid &= validateDouble("matching", "max_expected_distance", 0.01, 10.0);
    all_valid &= validateDouble("matching", "template_primary_weight", 0.0, 1.0);
    all_valid &= validateChoice("matching", "length_policy", {"reject", "truncate"});

    // Weights are blended, so they must not all vanish
    auto we = getDouble("matching", "weight_euclidean");
    auto wc = getDouble("matching", "weight_cosine");
    auto wm = getDouble("matching", "weight_manhattan");
    if (we && wc && wm && (*we + *wc + *wm) <= 0.0) {
        validation_errors_.push_back("[matching] distance weights sum to zero");
        all_valid = false;
    }

    // Logical consistency: low threshold must not exceed high threshold
    auto low = getDouble("matching", "low_quality_threshold");
    auto high = getDouble("matching", "high_quality_threshold");
    if (low && high && *low > *high) {
        validation_errors_.push_back(
            "[matching].low_quality_threshold (" + std::to_string(*low) +
            ") must be <= high_quality_threshold (" + std::to_string(*high) + ")");
        all_valid = false;
    }

    // Quality
    all_valid &= validateDouble("quality", "size_gain", 0.1, 1000.0);
    all_valid &= validateDouble("quality", "clarity_scale", 1.0, 100000.0);

    // Logging
    auto level = getString("logging", "level");
    if (level && !parseLogLevel(*level)) {
        validation_errors_.push_back("[logging].level = " + *level +
                                     " must be one of: debug, info, warning, error");
        all_valid = false;
    }
    all_valid &= validateInt("logging", "max_lines", 0, 1000000);

    return all_valid;
}

} // namespace facesig
