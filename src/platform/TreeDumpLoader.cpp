#include "TreeDumpLoader.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <cstdio>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace platform
{

namespace
{

bool parse_action_name(const std::string& name, deskpilot::NodeAction& out)
{
    if (name == "click")
        out = deskpilot::NodeAction::Click;
    else if (name == "long_click")
        out = deskpilot::NodeAction::LongClick;
    else if (name == "focus")
        out = deskpilot::NodeAction::Focus;
    else if (name == "accessibility_focus")
        out = deskpilot::NodeAction::AccessibilityFocus;
    else
        return false;
    return true;
}

} // namespace

bool TreeDumpLoader::parseBounds(const std::string& text, deskpilot::Rect& outRect)
{
    deskpilot::Rect r;
    char tail = 0;
    if (std::sscanf(text.c_str(), " [%d,%d][%d,%d]%c", &r.left, &r.top, &r.right, &r.bottom, &tail) != 4)
        return false;
    outRect = r;
    return true;
}

bool TreeDumpLoader::parseNode(const json& dump, int depth, deskpilot::MemoryNode& out, std::string& outError)
{
    if (depth > kMaxDepth)
    {
        outError = "Hierarchy deeper than " + std::to_string(kMaxDepth) + " levels";
        return false;
    }
    if (!dump.is_object())
    {
        outError = "Hierarchy node is not an object";
        return false;
    }

    out.class_name = dump.value("class", "");
    out.text = dump.value("text", "");
    out.content_description = dump.value("content_desc", "");
    out.view_id = dump.value("resource_id", "");
    out.clickable = dump.value("clickable", false);
    out.long_clickable = dump.value("long_clickable", false);
    out.focusable = dump.value("focusable", false);
    out.enabled = dump.value("enabled", true);
    out.visible = dump.value("visible", true);

    if (dump.contains("bounds"))
    {
        const json& b = dump["bounds"];
        if (b.is_string())
        {
            if (!parseBounds(b.get<std::string>(), out.bounds))
            {
                outError = "Malformed bounds '" + b.get<std::string>() + "'";
                return false;
            }
        }
        else if (b.is_array() && b.size() == 4)
        {
            out.bounds = deskpilot::Rect{ b[0].get<int>(), b[1].get<int>(), b[2].get<int>(), b[3].get<int>() };
        }
        else
        {
            outError = "Bounds must be \"[l,t][r,b]\" or an array of four integers";
            return false;
        }
    }

    if (dump.contains("actions") && dump["actions"].is_object())
    {
        for (const auto& [name, result] : dump["actions"].items())
        {
            deskpilot::NodeAction action;
            if (!parse_action_name(name, action))
            {
                PLOG_WARNING << "TreeDumpLoader: unknown action '" << name << "' ignored";
                continue;
            }
            out.action_results[action] = result.get<bool>();
        }
    }

    if (dump.contains("children"))
    {
        const json& children = dump["children"];
        if (!children.is_array())
        {
            outError = "'children' must be an array";
            return false;
        }
        out.children.reserve(children.size());
        for (const auto& child : children)
        {
            deskpilot::MemoryNode node;
            if (!parseNode(child, depth + 1, node, outError))
                return false;
            out.children.push_back(std::move(node));
        }
    }
    return true;
}

bool TreeDumpLoader::parse(const json& dump, deskpilot::MemoryNode& outRoot, std::string& outError)
{
    try
    {
        deskpilot::MemoryNode root;
        if (!parseNode(dump, 0, root, outError))
            return false;
        outRoot = std::move(root);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("Malformed hierarchy: ") + e.what();
        return false;
    }
}

bool TreeDumpLoader::parseString(const std::string& content, deskpilot::MemoryNode& outRoot, std::string& outError)
{
    try
    {
        return parse(json::parse(content), outRoot, outError);
    }
    catch (const json::parse_error& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        return false;
    }
}

bool TreeDumpLoader::parseFile(const std::string& filePath, deskpilot::MemoryNode& outRoot, std::string& outError)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        outError = "Failed to open hierarchy dump: " + filePath;
        PLOG_ERROR << outError;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseString(buffer.str(), outRoot, outError);
}

} // namespace platform
