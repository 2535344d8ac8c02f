#pragma once

#include "deskpilot/tree/MemoryUiTree.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace platform
{

/**
 * @brief Reads window hierarchy dumps into deskpilot::MemoryNode trees
 *
 * The dump is the JSON form of a uiautomator hierarchy:
 *
 *   { "class": "android.widget.Button", "text": "ACCEPT",
 *     "resource_id": "android:id/button1", "content_desc": "",
 *     "clickable": true, "enabled": true, "bounds": "[89,1210][991,1399]",
 *     "actions": { "click": false }, "children": [ ... ] }
 *
 * Every field is optional. "bounds" may also be an array [left, top, right, bottom].
 * "actions" forces the result of individual actions (click, long_click,
 * focus, accessibility_focus).
 */
class TreeDumpLoader
{
public:
    static constexpr int kMaxDepth = 64;

    static bool parse(const nlohmann::json& dump, deskpilot::MemoryNode& outRoot, std::string& outError);
    static bool parseString(const std::string& content, deskpilot::MemoryNode& outRoot, std::string& outError);
    static bool parseFile(const std::string& filePath, deskpilot::MemoryNode& outRoot, std::string& outError);

    /// "[l,t][r,b]" as printed by uiautomator
    static bool parseBounds(const std::string& text, deskpilot::Rect& outRect);

private:
    static bool parseNode(const nlohmann::json& dump, int depth, deskpilot::MemoryNode& out, std::string& outError);
};

} // namespace platform
