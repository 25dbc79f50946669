#pragma once

#include "frame_types.hpp"

namespace roofwatch {

// Maps one frame to OPEN or CLOSED. Implementations are pure functions of the
// pixel content for a fixed model.
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual bool ready() const = 0;

    // Throws ModelNotLoaded, InvalidFrame or FrameUnreadable.
    virtual ClassificationResult classify(const Frame& frame) const = 0;
};

// OPEN only when the score is strictly above the threshold. A score sitting
// exactly on the threshold reports CLOSED.
RoofLabel label_for_score(double open_score, double threshold);

ClassificationResult make_result(const Frame& frame, double open_score, double threshold);

}  // namespace roofwatch
