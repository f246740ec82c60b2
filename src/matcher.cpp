#include "matcher.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace facesig {

Matcher::Matcher(const MatcherSettings& settings)
    : settings_(settings) {
}

DistanceComponents Matcher::computeComponents(const Signature& a, const Signature& b, size_t length) {
    DistanceComponents c;

    double sq_diff = 0.0;
    double abs_diff = 0.0;
    double dot = 0.0;
    double sq_a = 0.0;
    double sq_b = 0.0;

    for (size_t i = 0; i < length; i++) {
        const double d = a[i] - b[i];
        sq_diff += d * d;
        abs_diff += std::abs(d);
        dot += a[i] * b[i];
        sq_a += a[i] * a[i];
        sq_b += b[i] * b[i];
    }

    const double n = static_cast<double>(length);
    c.euclidean = std::sqrt(sq_diff) / std::sqrt(n);
    c.manhattan = abs_diff / n;

    if (sq_a == 0.0 || sq_b == 0.0) {
        c.cosine = 1.0;
    } else {
        // sqrt(sq_a * sq_b) keeps cos(a, a) exactly 1
        double cosine_sim = dot / std::sqrt(sq_a * sq_b);
        cosine_sim = std::clamp(cosine_sim, -1.0, 1.0);
        c.cosine = 1.0 - cosine_sim;
    }

    return c;
}

double Matcher::combine(const DistanceComponents& components) const {
    return settings_.weight_euclidean * components.euclidean +
           settings_.weight_cosine * components.cosine +
           settings_.weight_manhattan * components.manhattan;
}

double Matcher::adaptiveTolerance(double base_tolerance, double probe_confidence) const {
    if (probe_confidence > settings_.high_quality_threshold) {
        return base_tolerance * settings_.high_quality_multiplier;
    }
    if (probe_confidence < settings_.low_quality_threshold) {
        return base_tolerance * settings_.low_quality_multiplier;
    }
    return base_tolerance;
}

double Matcher::confidencePercent(double distance) const {
    return std::clamp((1.0 - distance / settings_.max_expected_distance) * 100.0, 0.0, 100.0);
}

bool Matcher::comparableLength(const Signature& a, const Signature& b, size_t& length,
                               MatchResult& result) const {
    if (a.size() != b.size()) {
        if (settings_.length_policy == LengthPolicy::TRUNCATE_TO_SHORTER) {
            Logger::getInstance().warning("Signature length mismatch (" + std::to_string(a.size()) +
                " vs " + std::to_string(b.size()) + "), comparing common prefix");
        } else {
            result.error = ErrorCode::LENGTH_MISMATCH;
            result.message = "Signature length mismatch: stored " + std::to_string(a.size()) +
                             ", probe " + std::to_string(b.size());
            return false;
        }
    }

    length = std::min(a.size(), b.size());
    if (length == 0) {
        result.error = ErrorCode::LENGTH_MISMATCH;
        result.message = "Cannot compare empty signatures";
        return false;
    }
    return true;
}

void Matcher::decide(MatchResult& result, double probe_confidence, std::optional<double> tolerance) const {
    result.tolerance = adaptiveTolerance(tolerance.value_or(settings_.base_tolerance), probe_confidence);
    result.is_match = result.distance <= result.tolerance;
    result.confidence_percent = confidencePercent(result.distance);
    result.success = true;
}

MatchResult Matcher::match(const Signature& stored, const Signature& probe, double probe_confidence,
                           std::optional<double> tolerance) const {
    MatchResult result;

    size_t length = 0;
    if (!comparableLength(stored, probe, length, result)) {
        return result;
    }

    result.compared_length = length;
    result.components = computeComponents(stored, probe, length);
    result.distance = combine(result.components);
    decide(result, probe_confidence, tolerance);
    return result;
}

MatchResult Matcher::matchTemplate(const EnrollmentTemplate& enrolled, const Signature& probe,
                                   double probe_confidence, std::optional<double> tolerance) const {
    MatchResult primary = match(enrolled.primary, probe, probe_confidence, tolerance);
    if (!primary.success || enrolled.samples.empty()) {
        return primary;
    }

    double best_sample = std::numeric_limits<double>::infinity();
    for (const auto& sample : enrolled.samples) {
        MatchResult r = match(sample, probe, probe_confidence, tolerance);
        if (!r.success) {
            return r;
        }
        best_sample = std::min(best_sample, r.distance);
    }

    const double w = settings_.template_primary_weight;
    primary.distance = w * primary.distance + (1.0 - w) * best_sample;
    decide(primary, probe_confidence, tolerance);
    return primary;
}

} // namespace facesig
