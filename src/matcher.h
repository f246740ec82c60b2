#ifndef FACESIG_MATCHER_H
#define FACESIG_MATCHER_H

#include "signature.h"
#include "engine_config.h"
#include "errors.h"
#include <optional>
#include <string>

namespace facesig {

struct DistanceComponents {
    double euclidean = 0.0;     // ||a-b|| / sqrt(L)
    double cosine = 0.0;        // 1 - cos(a,b); 1 when either norm is zero
    double manhattan = 0.0;     // sum|a-b| / L
};

struct MatchResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;

    double distance = 0.0;
    bool is_match = false;
    double confidence_percent = 0.0;
    double tolerance = 0.0;         // adaptive tolerance actually applied
    DistanceComponents components;
    size_t compared_length = 0;
};

class Matcher {
public:
    explicit Matcher(const MatcherSettings& settings);

    // a and b must have equal, non-zero length
    static DistanceComponents computeComponents(const Signature& a, const Signature& b, size_t length);

    double combine(const DistanceComponents& components) const;

    // Base tolerance scaled by the probe's capture-quality confidence
    double adaptiveTolerance(double base_tolerance, double probe_confidence) const;

    // (1 - distance / max_expected_distance) * 100, clamped to [0,100]
    double confidencePercent(double distance) const;

    // Compare a stored signature against a probe signature.
    // `tolerance` overrides the configured base tolerance.
    MatchResult match(const Signature& stored, const Signature& probe, double probe_confidence,
                      std::optional<double> tolerance = std::nullopt) const;

    // Distance = w * d(primary) + (1 - w) * min_i d(sample_i); primary only
    // when the template carries no samples.
    MatchResult matchTemplate(const EnrollmentTemplate& enrolled, const Signature& probe,
                              double probe_confidence,
                              std::optional<double> tolerance = std::nullopt) const;

    const MatcherSettings& settings() const { return settings_; }

private:
    // Applies the length policy; fills `result` with LENGTH_MISMATCH on failure
    bool comparableLength(const Signature& a, const Signature& b, size_t& length,
                          MatchResult& result) const;

    void decide(MatchResult& result, double probe_confidence, std::optional<double> tolerance) const;

    MatcherSettings settings_;
};

} // namespace facesig

#endif // FACESIG_MATCHER_H
