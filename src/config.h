#ifndef FACESIG_CONFIG_H
#define FACESIG_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace facesig {

// INI-style settings store: "[section]" headers, "key = value" pairs,
// '#' or ';' comment lines.
class Config {
public:
    static Config& getInstance();

    // Replaces all current values. Returns false if the file can't be read
    // or a value fails validation (details in getValidationErrors()).
    bool load(const std::string& path);
    void clear();

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

private:
    Config() = default;
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;

    std::string trim(const std::string& str) const;
    bool validate();
    bool validateInt(const std::string& section, const std::string& key, int min_val, int max_val);
    bool validateDouble(const std::string& section, const std::string& key, double min_val, double max_val);
    bool validateChoice(const std::string& section, const std::string& key,
                        const std::vector<std::string>& choices);
};

} // namespace facesig

#endif // FACESIG_CONFIG_H
