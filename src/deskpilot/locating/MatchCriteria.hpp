#pragma once

#include "../tree/UiNode.hpp"

#include <string>
#include <vector>

namespace deskpilot
{

enum class MatchKind
{
    ExactId,        // platform view-id lookup
    LiteralText,    // platform text lookup, case-insensitive
    Structural,     // breadth-first predicate over class name and interactivity
    AbsoluteBounds  // exact screen rectangle; device specific, last resort
};

const char* MatchKindName(MatchKind kind);

enum class CaptionMatch
{
    Equals,
    Contains
};

/**
 * @brief Data-driven description of one way to find an element
 *
 * A criteria is a kind plus a pattern (view id, caption or class-name
 * fragment, depending on the kind), narrowed by optional filters. New UI
 * variants are supported by adding criteria to UiSignatures, not code paths.
 */
struct MatchCriteria
{
    MatchKind kind = MatchKind::ExactId;
    std::string pattern;

    // Caption allow-list checked against the node's own text; empty = any
    std::vector<std::string> captions;
    CaptionMatch caption_match = CaptionMatch::Equals;

    // Captions that disqualify a node (e.g. a cancel button sharing an id)
    std::vector<std::string> excluded_captions;

    // At least one direct child caption must contain one of these
    std::vector<std::string> child_captions;

    // Exact number of children; negative = any
    int child_count = -1;

    // Extra class-name filter for the id/text kinds
    std::string class_contains;

    bool require_clickable = false;
    bool require_enabled = false;

    // LiteralText only: climb from a non-interactive match to the nearest clickable ancestor
    bool walk_to_clickable_ancestor = false;

    Rect bounds{};

    static MatchCriteria ById(std::string view_id);
    static MatchCriteria ByText(std::string caption);
    static MatchCriteria ByStructure(std::string class_fragment);
    static MatchCriteria ByBounds(Rect rect);

    MatchCriteria& WithCaptions(std::vector<std::string> list, CaptionMatch match = CaptionMatch::Equals);
    MatchCriteria& Excluding(std::vector<std::string> list);
    MatchCriteria& WithChildCaptions(std::vector<std::string> list);
    MatchCriteria& WithChildCount(int count);
    MatchCriteria& InClass(std::string fragment);
    MatchCriteria& Clickable();
    MatchCriteria& Enabled();
    MatchCriteria& Interactive();
    MatchCriteria& WalkUpToClickable();

    /// Short description for logs, e.g. "id:android:id/button1"
    std::string Describe() const;
};

/**
 * @brief Evaluate every filter of `criteria` except the lookup itself
 *
 * @param check_interactivity When false, clickable/enabled filters are skipped
 *        (used for text matches that will be replaced by an ancestor).
 */
bool PassesFilters(const MatchCriteria& criteria, const UiNode& node, bool check_interactivity = true);

} // namespace deskpilot
