#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace deskpilot::text
{

inline std::string ToLower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string Trim(std::string_view s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle)
{
    if (needle.empty())
        return true;
    if (needle.size() > haystack.size())
        return false;
    return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

// Empty list means "any caption".
inline bool MatchesAnyCaption(std::string_view caption, const std::vector<std::string>& candidates, bool exact)
{
    if (candidates.empty())
        return true;

    const std::string trimmed = Trim(caption);
    for (const auto& candidate : candidates)
    {
        if (exact ? EqualsIgnoreCase(trimmed, candidate) : ContainsIgnoreCase(trimmed, candidate))
            return true;
    }
    return false;
}

} // namespace deskpilot::text
