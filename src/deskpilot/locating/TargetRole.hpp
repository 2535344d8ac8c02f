#pragma once

namespace deskpilot
{

/// Interactive elements the flow needs to act on or check for.
enum class TargetRole
{
    AcceptButton,
    DismissButton,
    ModeSelector,       // screen-share mode spinner
    EntireScreenOption, // "Share entire screen" entry in the chooser
    ConfirmButton       // "Share screen"
};

inline const char* TargetRoleName(TargetRole role)
{
    switch (role)
    {
    case TargetRole::AcceptButton:
        return "AcceptButton";
    case TargetRole::DismissButton:
        return "DismissButton";
    case TargetRole::ModeSelector:
        return "ModeSelector";
    case TargetRole::EntireScreenOption:
        return "EntireScreenOption";
    case TargetRole::ConfirmButton:
        return "ConfirmButton";
    }
    return "Unknown";
}

} // namespace deskpilot
