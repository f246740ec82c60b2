#ifndef FACESIG_AGGREGATOR_H
#define FACESIG_AGGREGATOR_H

#include "signature.h"
#include "errors.h"
#include <string>
#include <vector>

namespace facesig {

// Outcome of encoding one enrollment sample
struct SampleOutcome {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;
    Signature signature;
};

struct AggregateResult {
    bool success = false;
    ErrorCode error = ErrorCode::NONE;
    std::string message;

    EnrollmentTemplate tmpl;        // primary = element-wise mean of the accepted samples
    size_t successful_encodings = 0;
    size_t failed_encodings = 0;
    std::vector<std::string> diagnostics;   // one line per rejected sample
    std::string tag;                // "excellent", "good", "acceptable" or empty
};

// Qualitative label for the number of accepted samples
std::string aggregationTag(size_t successful);

// Combine per-sample outcomes in input order. Failed samples are counted and
// described in diagnostics; a successful sample whose length differs from the
// first accepted one is rejected the same way. Fails with NO_USABLE_SAMPLES
// only when nothing is accepted.
AggregateResult aggregateOutcomes(const std::vector<SampleOutcome>& outcomes);

// Same as above for signatures that were built elsewhere
AggregateResult aggregateSignatures(const std::vector<Signature>& signatures);

} // namespace facesig

#endif // FACESIG_AGGREGATOR_H
