#pragma once

#include "../locating/MatchCriteria.hpp"
#include "../locating/TargetRole.hpp"

#include <optional>
#include <string>
#include <vector>

namespace deskpilot
{

enum class DialogShape
{
    IncomingConnection, // source app: "Incoming connection request"
    ShareDialog,        // companion: share-screen dialog with the mode selector
    ShareChooser,       // companion: "Share entire screen" / "Share one app" list
    ShareConfirm        // companion: dialog with entire screen selected and the confirm button
};

const char* DialogShapeName(DialogShape shape);

/// Signal that holds when a role is located and its selected value contains `fragment`.
struct RoleReading
{
    TargetRole role = TargetRole::ModeSelector;
    std::string fragment;
};

/**
 * @brief One piece of evidence for a dialog shape
 *
 * Exactly one of the three forms is used:
 *  - any_of: the first criteria with at least one match fires the signal
 *  - all_of_roles: every listed role must be locatable
 *  - reading: a located role shows a given value
 */
struct EvidenceSignal
{
    std::string name;
    int weight = 0;
    std::vector<MatchCriteria> any_of;
    std::vector<TargetRole> all_of_roles;
    std::optional<RoleReading> reading;
};

struct ShapeProfile
{
    DialogShape shape = DialogShape::IncomingConnection;
    int threshold = 4;
    std::vector<EvidenceSignal> signals;
};

struct EvidenceReport
{
    DialogShape shape = DialogShape::IncomingConnection;
    int score = 0;
    int threshold = 0;
    std::vector<std::string> signals;

    // Two independent signals at minimum, so a single heavy signal never confirms a shape
    bool Confirmed() const { return score >= threshold && signals.size() >= 2; }

    bool Has(const std::string& signal) const;

    /// e.g. "ShareDialog score=4/4 [container, mode_selector]"
    std::string Summary() const;
};

} // namespace deskpilot
