#pragma once

#include "Evidence.hpp"
#include "../api/logger.hpp"
#include "../locating/NodeLocator.hpp"
#include "../tree/NodeAccess.hpp"

#include <vector>

namespace deskpilot
{

/**
 * @brief Evidence-scoring classifier for the known dialog shapes
 *
 * Each signal of the shape's profile is evaluated against the snapshot and its
 * weight added to the score when it fires. Every handle produced while
 * checking a signal is released before the next signal is evaluated.
 */
class DialogDetector
{
public:
    DialogDetector(const NodeAccess& access, const NodeLocator& locator, std::vector<ShapeProfile> profiles,
                   const Logger& logger);

    EvidenceReport Classify(const Snapshot& snapshot, DialogShape shape) const;

    const ShapeProfile* FindProfile(DialogShape shape) const;

private:
    bool Evaluate(const Snapshot& snapshot, const EvidenceSignal& signal) const;

    const NodeAccess& access_;
    const NodeLocator& locator_;
    std::vector<ShapeProfile> profiles_;
    const Logger& logger_;
};

} // namespace deskpilot
