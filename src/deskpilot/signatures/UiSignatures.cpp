#include "UiSignatures.hpp"

namespace deskpilot
{

namespace
{

// Shared with every AlertDialog on the platform, hence the caption allow-lists
constexpr const char* kPositiveButtonId = "android:id/button1";
constexpr const char* kNegativeButtonId = "android:id/button2";

constexpr const char* kEntireScreenCaption = "Share entire screen";
constexpr const char* kOneAppCaption = "Share one app";

// Layout of the known device; only used as last-resort evidence
constexpr Rect kChooserBounds{ 89, 1021, 991, 1399 };
constexpr Rect kEntireScreenOptionBounds{ 89, 1210, 991, 1399 };

std::string Id(const std::string& package, const char* name) { return package + ":id/" + name; }

EvidenceSignal AnyOf(std::string name, int weight, std::vector<MatchCriteria> criteria)
{
    EvidenceSignal signal;
    signal.name = std::move(name);
    signal.weight = weight;
    signal.any_of = std::move(criteria);
    return signal;
}

EvidenceSignal AllOf(std::string name, int weight, std::vector<TargetRole> roles)
{
    EvidenceSignal signal;
    signal.name = std::move(name);
    signal.weight = weight;
    signal.all_of_roles = std::move(roles);
    return signal;
}

EvidenceSignal Reads(std::string name, int weight, TargetRole role, std::string fragment)
{
    EvidenceSignal signal;
    signal.name = std::move(name);
    signal.weight = weight;
    signal.reading = RoleReading{ role, std::move(fragment) };
    return signal;
}

std::vector<LocatorRecipe> BuildRecipes(const std::string& companion)
{
    std::vector<LocatorRecipe> recipes;

    recipes.push_back(LocatorRecipe{
        TargetRole::AcceptButton,
        {
            MatchCriteria::ById(kPositiveButtonId).WithCaptions({ "ACCEPT", "ALLOW", "OK" }).Interactive(),
            MatchCriteria::ByText("ACCEPT").WithCaptions({ "ACCEPT" }).WalkUpToClickable(),
        },
        false });

    recipes.push_back(LocatorRecipe{
        TargetRole::DismissButton,
        {
            MatchCriteria::ById(kNegativeButtonId).WithCaptions({ "DISMISS", "DENY", "CANCEL" }).Interactive(),
            MatchCriteria::ByText("DISMISS").WithCaptions({ "DISMISS" }).WalkUpToClickable(),
        },
        false });

    recipes.push_back(LocatorRecipe{
        TargetRole::ModeSelector,
        {
            MatchCriteria::ById(Id(companion, "screen_share_mode_options")).Clickable(),
            MatchCriteria::ByStructure("Spinner").Interactive(),
        },
        false });

    recipes.push_back(LocatorRecipe{
        TargetRole::EntireScreenOption,
        {
            MatchCriteria::ByText(kEntireScreenCaption).WalkUpToClickable(),
            MatchCriteria::ByStructure("LinearLayout").Clickable().WithChildCaptions({ kEntireScreenCaption }),
            MatchCriteria::ByBounds(kEntireScreenOptionBounds).Clickable(),
        },
        true });

    recipes.push_back(LocatorRecipe{
        TargetRole::ConfirmButton,
        {
            MatchCriteria::ById(kPositiveButtonId).WithCaptions({ "Share screen", "Share", "Start" }).Clickable(),
            MatchCriteria::ByText("Share screen").WithCaptions({ "Share screen" }).InClass("Button").Clickable(),
            MatchCriteria::ByText("Share").InClass("Button").Clickable().Excluding({ kEntireScreenCaption, kOneAppCaption }),
            MatchCriteria::ByStructure("Button").Clickable().Excluding({ "Cancel" }),
        },
        true });

    return recipes;
}

std::vector<ShapeProfile> BuildProfiles(const std::string& source, const std::string& companion,
                                        const std::string& entire_screen)
{
    std::vector<ShapeProfile> profiles;

    const MatchCriteria share_container = MatchCriteria::ById(Id(companion, "screen_share_permission_dialog"));
    const MatchCriteria share_title = MatchCriteria::ById(Id(companion, "screen_share_dialog_title"))
                                          .WithCaptions({ "Share your screen" }, CaptionMatch::Contains);

    profiles.push_back(ShapeProfile{
        DialogShape::IncomingConnection,
        4,
        {
            AnyOf("title", 2,
                  { MatchCriteria::ById(Id(source, "dialog_accept_title_text"))
                        .WithCaptions({ "incoming" }, CaptionMatch::Contains) }),
            AnyOf("body", 2,
                  { MatchCriteria::ById(Id(source, "dialog_accept_msg"))
                        .WithCaptions({ "would like to", "view your desk", "connect to" }, CaptionMatch::Contains) }),
            AnyOf("address", 1,
                  { MatchCriteria::ById(Id(source, "dialog_accept_address")),
                    MatchCriteria::ById(Id(source, "dialog_accept_alias")) }),
            AnyOf("permissions", 1,
                  { MatchCriteria::ById(Id(source, "dialog_accept_permissions_title")),
                    MatchCriteria::ById(Id(source, "dialog_accept_permissions_container")) }),
            AllOf("accept_and_dismiss", 3, { TargetRole::AcceptButton, TargetRole::DismissButton }),
            AnyOf("profile_selector", 1, { MatchCriteria::ById(Id(source, "dialog_accept_profiles_list")) }),
        } });

    profiles.push_back(ShapeProfile{
        DialogShape::ShareDialog,
        4,
        {
            AnyOf("container", 2, { share_container, share_title }),
            AllOf("mode_selector", 2, { TargetRole::ModeSelector }),
        } });

    profiles.push_back(ShapeProfile{
        DialogShape::ShareChooser,
        4,
        {
            AnyOf("entire_screen_option", 2, { MatchCriteria::ByText(kEntireScreenCaption) }),
            AnyOf("one_app_option", 2, { MatchCriteria::ByText(kOneAppCaption) }),
            AnyOf("two_item_list", 2,
                  { MatchCriteria::ByStructure("ListView").WithChildCount(2).WithChildCaptions({ "Share" }) }),
            AnyOf("chooser_bounds", 1, { MatchCriteria::ByBounds(kChooserBounds) }),
        } });

    profiles.push_back(ShapeProfile{
        DialogShape::ShareConfirm,
        4,
        {
            AnyOf("container", 2, { share_container, share_title }),
            Reads("selector_entire_screen", 2, TargetRole::ModeSelector, entire_screen),
            AllOf("confirm_button", 2, { TargetRole::ConfirmButton }),
        } });

    return profiles;
}

} // namespace

UiSignatures UiSignatures::ForPackages(const std::string& source_package, const std::string& companion_package)
{
    UiSignatures signatures;
    signatures.recipes = BuildRecipes(companion_package);
    signatures.profiles = BuildProfiles(source_package, companion_package, signatures.entire_screen_fragment);
    return signatures;
}

} // namespace deskpilot
