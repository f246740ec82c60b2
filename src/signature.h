#ifndef FACESIG_SIGNATURE_H
#define FACESIG_SIGNATURE_H

#include "face_region.h"
#include <vector>

namespace facesig {

// Ordered feature vector describing one face. Length is SIGNATURE_LENGTH for
// every signature this build produces.
using Signature = std::vector<double>;

// Enrollment result: mean of the accepted samples plus the samples themselves
struct EnrollmentTemplate {
    Signature primary;
    std::vector<Signature> samples;
};

double l2Norm(const Signature& values);

// Divide by the Euclidean norm. A zero vector is left untouched and the
// function returns false (degenerate input, not an error).
bool normalizeL2(Signature& values);

struct SignatureBuild {
    Signature signature;
    bool degenerate = false;    // all-zero before normalization
};

// Run every descriptor on `region` and concatenate the outputs in canonical
// order, then L2-normalize. With `parallel`, descriptors run as async tasks;
// the concatenation order does not depend on completion order.
SignatureBuild buildSignature(const FaceRegion& region, bool parallel = true);

// Element-wise arithmetic mean. All inputs must share one length; returns an
// empty signature for an empty or ragged input.
Signature averageSignatures(const std::vector<Signature>& signatures);

} // namespace facesig

#endif // FACESIG_SIGNATURE_H
