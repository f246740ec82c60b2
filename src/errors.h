#ifndef FACESIG_ERRORS_H
#define FACESIG_ERRORS_H

#include <string>

namespace facesig {

// Failure categories reported by engine operations. None of them is fatal:
// every operation hands the code back inside its result struct.
enum class ErrorCode {
    NONE,
    INVALID_IMAGE,              // empty buffer or unsupported channel count
    NO_FACE_DETECTED,           // every detection tier came back empty
    MULTIPLE_FACES_AMBIGUOUS,   // strict mode and more than one candidate
    LENGTH_MISMATCH,            // stored and probe signatures differ in schema
    DEGENERATE_SIGNATURE,       // zero-norm vector (warning only)
    NO_USABLE_SAMPLES           // aggregation had no successful sample
};

inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                     return "None";
        case ErrorCode::INVALID_IMAGE:            return "InvalidImage";
        case ErrorCode::NO_FACE_DETECTED:         return "NoFaceDetected";
        case ErrorCode::MULTIPLE_FACES_AMBIGUOUS: return "MultipleFacesAmbiguous";
        case ErrorCode::LENGTH_MISMATCH:          return "LengthMismatch";
        case ErrorCode::DEGENERATE_SIGNATURE:     return "DegenerateSignature";
        case ErrorCode::NO_USABLE_SAMPLES:        return "NoUsableSamples";
        default:                                  return "Unknown";
    }
}

} // namespace facesig

#endif // FACESIG_ERRORS_H
