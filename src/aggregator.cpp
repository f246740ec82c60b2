#include "aggregator.h"
#include "logger.h"

namespace facesig {

std::string aggregationTag(size_t successful) {
    if (successful >= 3) return "excellent";
    if (successful == 2) return "good";
    if (successful == 1) return "acceptable";
    return "";
}

AggregateResult aggregateOutcomes(const std::vector<SampleOutcome>& outcomes) {
    AggregateResult result;
    std::vector<Signature> accepted;

    for (size_t i = 0; i < outcomes.size(); i++) {
        const SampleOutcome& outcome = outcomes[i];

        if (!outcome.success) {
            result.failed_encodings++;
            result.diagnostics.push_back("sample " + std::to_string(i) + ": " +
                errorCodeToString(outcome.error) +
                (outcome.message.empty() ? "" : " (" + outcome.message + ")"));
            continue;
        }

        if (!accepted.empty() && outcome.signature.size() != accepted.front().size()) {
            result.failed_encodings++;
            result.diagnostics.push_back("sample " + std::to_string(i) + ": " +
                errorCodeToString(ErrorCode::LENGTH_MISMATCH) + " (length " +
                std::to_string(outcome.signature.size()) + ", expected " +
                std::to_string(accepted.front().size()) + ")");
            continue;
        }

        accepted.push_back(outcome.signature);
    }

    result.successful_encodings = accepted.size();

    if (accepted.empty()) {
        result.error = ErrorCode::NO_USABLE_SAMPLES;
        result.message = "None of the " + std::to_string(outcomes.size()) +
                         " sample(s) produced a usable signature";
        Logger::getInstance().auditAggregate(0, result.failed_encodings, "");
        return result;
    }

    result.tmpl.primary = averageSignatures(accepted);
    result.tmpl.samples = std::move(accepted);
    result.tag = aggregationTag(result.successful_encodings);
    result.success = true;
    result.message = "Aggregated " + std::to_string(result.successful_encodings) + " of " +
                     std::to_string(outcomes.size()) + " sample(s)";

    Logger::getInstance().auditAggregate(result.successful_encodings, result.failed_encodings, result.tag);
    return result;
}

AggregateResult aggregateSignatures(const std::vector<Signature>& signatures) {
    std::vector<SampleOutcome> outcomes;
    outcomes.reserve(signatures.size());
    for (const auto& s : signatures) {
        SampleOutcome outcome;
        outcome.success = !s.empty();
        if (!outcome.success) {
            outcome.error = ErrorCode::LENGTH_MISMATCH;
            outcome.message = "empty signature";
        }
        outcome.signature = s;
        outcomes.push_back(std::move(outcome));
    }
    return aggregateOutcomes(outcomes);
}

} // namespace facesig
