#include "face_engine.h"
#include "imgproc.h"
#include "logger.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace facesig {

FaceEngine::FaceEngine(FaceRectDetector& detector, const EngineConfig& config)
    : config_(config),
      selector_(detector, config_.detection),
      matcher_(config_.matching) {
}

bool FaceEngine::validFrame(const ImageView& frame, std::string& message) {
    if (frame.empty()) {
        message = "Empty image buffer";
        return false;
    }
    if (frame.channels() != 1 && frame.channels() != 3) {
        message = "Unsupported channel count " + std::to_string(frame.channels()) +
                  " (expected 1 or 3)";
        return false;
    }
    return true;
}

EncodeResult FaceEngine::encode(const ImageView& frame) const {
    auto start = std::chrono::steady_clock::now();
    EncodeResult result;

    if (!validFrame(frame, result.message)) {
        result.error = ErrorCode::INVALID_IMAGE;
        Logger::getInstance().warning("Encode rejected: " + result.message);
        return result;
    }

    try {
        Image gray = toGrayscale(frame);
        RegionSelection selection = selector_.select(frame, gray.view());

        if (!selection.success) {
            result.error = selection.error;
            result.message = selection.message;
        } else {
            result.face = selection.face;
            result.region = selection.region.rectangle;
            result.quality = estimateQuality(selection.face, frame.width(), frame.height(),
                                             selection.region.gray.view(), config_.quality);

            SignatureBuild build = buildSignature(selection.region, config_.parallel_extraction);
            result.signature = std::move(build.signature);
            result.degenerate = build.degenerate;
            result.success = true;
            if (result.degenerate) {
                result.message = errorCodeToString(ErrorCode::DEGENERATE_SIGNATURE);
            }
        }
    } catch (const std::exception& e) {
        result = EncodeResult();
        result.error = ErrorCode::INVALID_IMAGE;
        result.message = std::string("Encoding failed: ") + e.what();
        Logger::getInstance().error(result.message);
    }

    auto end = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();
    Logger::getInstance().auditEncode(
        std::to_string(frame.width()) + "x" + std::to_string(frame.height()),
        result.success, result.quality.confidence, ms);

    return result;
}

MatchResult FaceEngine::compare(const Signature& stored, const ImageView& probe,
                                std::optional<double> tolerance) const {
    EncodeResult encoded = encode(probe);
    if (!encoded.success) {
        MatchResult failed;
        failed.error = encoded.error;
        failed.message = encoded.message;
        return failed;
    }

    MatchResult result = matcher_.match(stored, encoded.signature, encoded.quality.confidence, tolerance);
    if (result.success) {
        Logger::getInstance().auditCompare(result.distance, result.tolerance, result.is_match);
    } else {
        Logger::getInstance().warning("Compare failed: " + result.message);
    }
    return result;
}

MatchResult FaceEngine::compareTemplate(const EnrollmentTemplate& enrolled, const ImageView& probe,
                                        std::optional<double> tolerance) const {
    EncodeResult encoded = encode(probe);
    if (!encoded.success) {
        MatchResult failed;
        failed.error = encoded.error;
        failed.message = encoded.message;
        return failed;
    }

    MatchResult result = matcher_.matchTemplate(enrolled, encoded.signature,
                                                encoded.quality.confidence, tolerance);
    if (result.success) {
        Logger::getInstance().auditCompare(result.distance, result.tolerance, result.is_match);
    } else {
        Logger::getInstance().warning("Template compare failed: " + result.message);
    }
    return result;
}

SampleOutcome FaceEngine::encodeSample(const EnrollmentSample& sample) const {
    SampleOutcome outcome;
    if (sample.frame.empty() && !sample.decode_error.empty()) {
        outcome.error = ErrorCode::INVALID_IMAGE;
        outcome.message = sample.decode_error;
        return outcome;
    }

    EncodeResult encoded = encode(sample.frame.view());
    outcome.success = encoded.success;
    outcome.error = encoded.error;
    outcome.message = std::move(encoded.message);
    outcome.signature = std::move(encoded.signature);
    return outcome;
}

AggregateResult FaceEngine::aggregate(const std::vector<EnrollmentSample>& samples) const {
    std::vector<SampleOutcome> outcomes(samples.size());
    std::atomic<size_t> next{0};

    auto drain = [&]() {
        for (size_t i = next++; i < samples.size(); i = next++) {
            try {
                outcomes[i] = encodeSample(samples[i]);
            } catch (const std::exception& e) {
                outcomes[i] = SampleOutcome();
                outcomes[i].error = ErrorCode::INVALID_IMAGE;
                outcomes[i].message = e.what();
            }
        }
    };

    // The calling thread is one of the workers
    const size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    const size_t worker_count = std::min(hardware, samples.size());

    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    for (size_t w = 1; w < worker_count; w++) {
        try {
            workers.push_back(std::async(std::launch::async, drain));
        } catch (const std::system_error& e) {
            Logger::getInstance().warning(std::string("Aggregation continues with fewer workers: ") + e.what());
            break;
        }
    }

    drain();
    for (auto& worker : workers) {
        worker.get();
    }

    return aggregateOutcomes(outcomes);
}

CaptureAssessment FaceEngine::assessCapture(const ImageView& frame) const {
    CaptureAssessment assessment;

    if (!validFrame(frame, assessment.message)) {
        assessment.error = ErrorCode::INVALID_IMAGE;
        return assessment;
    }

    try {
        Image gray = toGrayscale(frame);
        auto faces = selector_.detectCandidates(gray.view());

        if (faces.empty()) {
            assessment.message = "No face detected";
            return assessment;
        }
        if (faces.size() > 1) {
            assessment.face_count = static_cast<int>(faces.size());
            assessment.message = "Multiple faces detected";
            return assessment;
        }

        assessment = facesig::assessCapture(faces.front(), frame.width(), frame.height(),
                                            gray.view().roi(faces.front()));
    } catch (const std::exception& e) {
        assessment = CaptureAssessment();
        assessment.error = ErrorCode::INVALID_IMAGE;
        assessment.message = std::string("Capture assessment failed: ") + e.what();
        Logger::getInstance().error(assessment.message);
    }

    Logger::getInstance().debug("Capture assessment: " + assessment.message);
    return assessment;
}

} // namespace facesig
