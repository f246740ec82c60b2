#include "signature.h"
#include "descriptors/descriptors.h"
#include "logger.h"
#include <cmath>
#include <future>
#include <stdexcept>

namespace facesig {

double l2Norm(const Signature& values) {
    double sum = 0.0;
    for (double v : values) {
        sum += v * v;
    }
    return std::sqrt(sum);
}

bool normalizeL2(Signature& values) {
    const double norm = l2Norm(values);
    if (norm == 0.0) {
        return false;
    }
    for (double& v : values) {
        v /= norm;
    }
    return true;
}

SignatureBuild buildSignature(const FaceRegion& region, bool parallel) {
    const auto& descriptors = descriptorSet();
    std::array<FeatureVector, DESCRIPTOR_COUNT> outputs;

    if (parallel) {
        std::array<std::future<FeatureVector>, DESCRIPTOR_COUNT> pending;
        for (size_t i = 0; i < DESCRIPTOR_COUNT; i++) {
            const Descriptor& d = descriptors[i];
            pending[i] = std::async(std::launch::async, [&d, &region]() {
                return d.extract(region);
            });
        }
        // Collect in canonical order; get() rethrows any extractor failure
        for (size_t i = 0; i < DESCRIPTOR_COUNT; i++) {
            outputs[i] = pending[i].get();
        }
    } else {
        for (size_t i = 0; i < DESCRIPTOR_COUNT; i++) {
            outputs[i] = descriptors[i].extract(region);
        }
    }

    SignatureBuild build;
    build.signature.reserve(SIGNATURE_LENGTH);
    for (size_t i = 0; i < DESCRIPTOR_COUNT; i++) {
        if (outputs[i].size() != descriptors[i].length) {
            throw std::logic_error(std::string("descriptor '") + descriptors[i].name + "' produced " +
                                   std::to_string(outputs[i].size()) + " values, expected " +
                                   std::to_string(descriptors[i].length));
        }
        build.signature.insert(build.signature.end(), outputs[i].begin(), outputs[i].end());
    }

    if (!normalizeL2(build.signature)) {
        build.degenerate = true;
        Logger::getInstance().warning("Signature has zero norm, normalization skipped");
    }

    return build;
}

Signature averageSignatures(const std::vector<Signature>& signatures) {
    if (signatures.empty()) {
        return {};
    }

    const size_t length = signatures.front().size();
    Signature mean(length, 0.0);

    for (const auto& s : signatures) {
        if (s.size() != length) {
            Logger::getInstance().error("Cannot average signatures of different lengths (" +
                std::to_string(length) + " vs " + std::to_string(s.size()) + ")");
            return {};
        }
        for (size_t i = 0; i < length; i++) {
            mean[i] += s[i];
        }
    }

    const double count = static_cast<double>(signatures.size());
    for (double& v : mean) {
        v /= count;
    }
    return mean;
}

} // namespace facesig
