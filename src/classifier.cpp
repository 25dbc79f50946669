#include "roofwatch/classifier.hpp"

#include <algorithm>
#include <cmath>

#include "roofwatch/errors.hpp"

namespace roofwatch {

RoofLabel label_for_score(double open_score, double threshold) {
    return open_score > threshold ? RoofLabel::OPEN : RoofLabel::CLOSED;
}

ClassificationResult make_result(const Frame& frame, double open_score, double threshold) {
    if (std::isnan(open_score)) {
        throw InvalidFrame("model produced no score for " + frame.path().string());
    }
    ClassificationResult r;
    r.open_score = std::clamp(open_score, 0.0, 1.0);
    r.label = label_for_score(r.open_score, threshold);
    r.confidence = r.label == RoofLabel::OPEN ? r.open_score : 1.0 - r.open_score;
    r.frame_path = frame.path().string();
    r.frame_mtime = frame.mtime();
    r.evaluated_at = Clock::now();
    return r;
}

}  // namespace roofwatch
