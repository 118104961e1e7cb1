#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by parsing and header code.
 *
 * Provides case normalization, trimming, joining, splitting and JSON
 * escaping. Functions are header-inline because they are small
 * and reused in configuration, header, and report code paths.
 */

namespace gcm
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 * @param value Source string view.
 * @return Trimmed string.
 */
inline std::string trim_copy(std::string_view value)
{
    std::string out(value);
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), [](unsigned char ch)
    {
        return !std::isspace(ch);
    }));
    out.erase(std::find_if(out.rbegin(), out.rend(), [](unsigned char ch)
    {
        return !std::isspace(ch);
    }).base(), out.end());
    return out;
}

/**
 * @brief Joins items with a separator.
 * @param items Items to join, in order.
 * @param separator Text inserted between adjacent items.
 * @return Joined string; empty for an empty list.
 */
inline std::string join(const std::vector<std::string>& items, std::string_view separator = ",")
{
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i)
    {
        if (i > 0)
        {
            out.append(separator);
        }
        out.append(items[i]);
    }
    return out;
}

/**
 * @brief Splits text on a single delimiter, keeping empty pieces.
 */
inline std::vector<std::string> split(std::string_view value, char delimiter)
{
    std::vector<std::string> out;
    std::string current;
    for (char c : value)
    {
        if (c == delimiter)
        {
            out.push_back(current);
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    out.push_back(current);
    return out;
}

/**
 * @brief Escapes control characters for safe JSON string emission.
 * @param value Input string view.
 * @return Escaped JSON-safe string.
 */
inline std::string json_escape(std::string_view value)
{
    std::ostringstream oss;
    for (char c : value)
    {
        switch (c)
        {
            case '\\': oss << "\\\\"; break;
            case '"': oss << "\\\""; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default: oss << c; break;
        }
    }
    return oss.str();
}

} // namespace strutil
} // namespace gcm
