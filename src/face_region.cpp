#include "face_region.h"
#include "imgproc.h"
#include "logger.h"
#include "signature_layout.h"
#include <algorithm>

namespace facesig {

RegionSelector::RegionSelector(FaceRectDetector& detector, const DetectionSettings& settings)
    : detector_(detector), settings_(settings) {
}

std::vector<Rect> RegionSelector::detectCandidates(const ImageView& gray, int* tiers_tried) const {
    const Rect frame = gray.bounds();
    int tried = 0;
    std::vector<Rect> candidates;

    for (const auto& params : settings_.tiers) {
        tried++;
        auto raw = detector_.detect(gray, params);

        candidates.clear();
        for (Rect r : raw) {
            r &= frame;
            if (!r.empty()) {
                candidates.push_back(r);
            }
        }

        Logger::getInstance().debug("Detection tier " + std::to_string(tried) +
            " (scale=" + std::to_string(params.scale_factor) +
            ", neighbors=" + std::to_string(params.min_neighbors) +
            ", min_size=" + std::to_string(params.min_size) + "): " +
            std::to_string(candidates.size()) + " candidate(s)");

        if (!candidates.empty()) {
            break;
        }
    }

    if (tiers_tried) {
        *tiers_tried = tried;
    }
    return candidates;
}

size_t RegionSelector::pickLargest(const std::vector<Rect>& candidates) {
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); i++) {
        // Strict comparison keeps the first of equal areas
        if (candidates[i].area() > candidates[best].area()) {
            best = i;
        }
    }
    return best;
}

int RegionSelector::paddingFor(const Rect& face) {
    return std::max(20, std::min(face.width, face.height) / 4);
}

FaceRegion RegionSelector::extractRegion(const ImageView& frame, const ImageView& gray, const Rect& face) {
    FaceRegion region;
    region.rectangle = face.paddedWithin(paddingFor(face), gray.width(), gray.height());

    region.gray = resizeGray(gray.roi(region.rectangle), CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE);

    if (frame.channels() == 3) {
        region.color = resizeColor(frame.roi(region.rectangle), CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE);
    } else {
        // Grayscale source: replicate luma into all three channels
        region.color = Image(CANONICAL_FACE_SIZE, CANONICAL_FACE_SIZE, 3);
        for (int y = 0; y < CANONICAL_FACE_SIZE; y++) {
            for (int x = 0; x < CANONICAL_FACE_SIZE; x++) {
                uint8_t v = region.gray.at(x, y);
                region.color.at(x, y, 0) = v;
                region.color.at(x, y, 1) = v;
                region.color.at(x, y, 2) = v;
            }
        }
    }

    return region;
}

RegionSelection RegionSelector::select(const ImageView& frame, const ImageView& gray) const {
    RegionSelection selection;

    selection.candidates = detectCandidates(gray, &selection.tiers_tried);

    if (selection.candidates.empty()) {
        selection.error = ErrorCode::NO_FACE_DETECTED;
        selection.message = "No face detected after " + std::to_string(selection.tiers_tried) +
                            " detection tier(s)";
        return selection;
    }

    if (settings_.strict_single_face && selection.candidates.size() > 1) {
        selection.error = ErrorCode::MULTIPLE_FACES_AMBIGUOUS;
        selection.message = std::to_string(selection.candidates.size()) +
                            " faces detected; a single subject is required";
        return selection;
    }

    selection.face = selection.candidates[pickLargest(selection.candidates)];
    selection.region = extractRegion(frame, gray, selection.face);
    selection.success = true;

    Logger::getInstance().debug("Selected face (" + std::to_string(selection.face.x) + "," +
        std::to_string(selection.face.y) + " " + std::to_string(selection.face.width) + "x" +
        std::to_string(selection.face.height) + ") from " +
        std::to_string(selection.candidates.size()) + " candidate(s), crop " +
        std::to_string(selection.region.rectangle.width) + "x" +
        std::to_string(selection.region.rectangle.height));

    return selection;
}

} // namespace facesig
