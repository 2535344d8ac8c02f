#pragma once

#include "../detection/Evidence.hpp"
#include "../locating/NodeLocator.hpp"

#include <string>
#include <vector>

namespace deskpilot
{

/**
 * @brief Everything the engine knows about the two monitored applications' UIs
 *
 * Identifiers, captions, class-name fragments and the one known screen
 * rectangle all live here as data. Supporting another UI variant means adding
 * criteria to a recipe or a signal, not a new code path.
 */
struct UiSignatures
{
    std::vector<LocatorRecipe> recipes;
    std::vector<ShapeProfile> profiles;

    /// Selector value that means the whole screen will be shared
    std::string entire_screen_fragment = "entire screen";

    /// Signatures for the known source (remote-desktop) and companion (system UI) layouts
    static UiSignatures ForPackages(const std::string& source_package, const std::string& companion_package);
};

} // namespace deskpilot
