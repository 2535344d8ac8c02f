#include "DialogDetector.hpp"
#include "../util/Profile.hpp"
#include "../util/TextMatch.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace deskpilot
{

const char* DialogShapeName(DialogShape shape)
{
    switch (shape)
    {
    case DialogShape::IncomingConnection:
        return "IncomingConnection";
    case DialogShape::ShareDialog:
        return "ShareDialog";
    case DialogShape::ShareChooser:
        return "ShareChooser";
    case DialogShape::ShareConfirm:
        return "ShareConfirm";
    }
    return "Unknown";
}

bool EvidenceReport::Has(const std::string& signal) const
{
    return std::find(signals.begin(), signals.end(), signal) != signals.end();
}

std::string EvidenceReport::Summary() const
{
    std::ostringstream oss;
    oss << DialogShapeName(shape) << " score=" << score << "/" << threshold << " [";
    for (size_t i = 0; i < signals.size(); ++i)
    {
        if (i > 0)
            oss << ", ";
        oss << signals[i];
    }
    oss << "]";
    return oss.str();
}

DialogDetector::DialogDetector(const NodeAccess& access, const NodeLocator& locator,
                               std::vector<ShapeProfile> profiles, const Logger& logger)
    : access_(access)
    , locator_(locator)
    , profiles_(std::move(profiles))
    , logger_(logger)
{
}

const ShapeProfile* DialogDetector::FindProfile(DialogShape shape) const
{
    for (const auto& profile : profiles_)
    {
        if (profile.shape == shape)
            return &profile;
    }
    return nullptr;
}

EvidenceReport DialogDetector::Classify(const Snapshot& snapshot, DialogShape shape) const
{
    PROFILE_SCOPE_FUNCTION();

    EvidenceReport report;
    report.shape = shape;

    const ShapeProfile* profile = FindProfile(shape);
    if (!profile)
    {
        // Unknown shape never confirms
        report.threshold = 1 << 30;
        return report;
    }

    report.threshold = profile->threshold;
    for (const auto& signal : profile->signals)
    {
        if (Evaluate(snapshot, signal))
        {
            report.score += signal.weight;
            report.signals.push_back(signal.name);
        }
    }

    if (logger_.debug)
        logger_.debug("Classify " + report.Summary() + (report.Confirmed() ? " confirmed" : " rejected"));
    return report;
}

bool DialogDetector::Evaluate(const Snapshot& snapshot, const EvidenceSignal& signal) const
{
    if (!signal.any_of.empty())
    {
        for (const auto& criteria : signal.any_of)
        {
            if (criteria.walk_to_clickable_ancestor)
            {
                if (locator_.LocateWith(snapshot, criteria))
                    return true;
                continue;
            }
            if (access_.QueryFirst(snapshot, criteria))
                return true;
        }
        return false;
    }

    if (!signal.all_of_roles.empty())
    {
        for (TargetRole role : signal.all_of_roles)
        {
            if (!locator_.Locate(snapshot, role))
                return false;
        }
        return true;
    }

    if (signal.reading)
    {
        auto node = locator_.Locate(snapshot, signal.reading->role);
        if (!node)
            return false;
        std::string value = node->FirstChildText();
        if (value.empty())
            value = node->Caption();
        return text::ContainsIgnoreCase(value, signal.reading->fragment);
    }

    return false;
}

} // namespace deskpilot
