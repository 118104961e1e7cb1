/**
 * @file runtime_config.cpp
 * @brief Configuration parsing and logging profile state.
 *
 * Provides the YAML-like reader, typed value helpers, and the
 * process-wide log profile used by the builder and the command-line tool.
 */

#include "runtime_config.hpp"

#include "gcm_errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace gcm
{

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Returns a label for the logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed <= 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

namespace
{

// A '#' opens a comment unless it sits inside a value that starts with a quote.
std::string strip_comment(const std::string& line)
{
    const size_t first_hash = line.find('#');
    if (first_hash == std::string::npos)
    {
        return line;
    }
    size_t search_from = 0;
    const size_t colon_pos = line.find(':');
    if (colon_pos < first_hash)
    {
        const size_t value_pos = line.find_first_not_of(' ', colon_pos + 1);
        if (value_pos != std::string::npos && (line[value_pos] == '"' || line[value_pos] == '\''))
        {
            const size_t close_pos = line.find(line[value_pos], value_pos + 1);
            search_from = close_pos == std::string::npos ? line.size() : close_pos + 1;
        }
    }
    const size_t comment_pos = line.find('#', search_from);
    return comment_pos == std::string::npos ? line : line.substr(0, comment_pos);
}

}

ConfigEntries parse_yaml_simple(std::istream& input)
{
    ConfigEntries config;
    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(input, line))
    {
        line = strip_comment(line);

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = strutil::trim_copy(line.substr(0, line.size() - 1));

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack.resize(indent_level);
                section_stack.push_back(section_name);
            }

            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos)
        {
            std::cerr << "[CONFIG] Warning: ignoring line without ':' -> '" << line << "'" << std::endl;
            continue;
        }

        while (section_stack.size() > indent_level)
        {
            section_stack.pop_back();
        }

        const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
        const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

        std::string full_key;
        for (const auto& section : section_stack)
        {
            if (!full_key.empty()) full_key += ".";
            full_key += section;
        }
        if (!full_key.empty()) full_key += ".";
        full_key += key;

        auto existing = std::find_if(config.begin(), config.end(), [&full_key](const auto& entry)
        {
            return entry.first == full_key;
        });
        if (existing != config.end())
        {
            existing->second = value;
        }
        else
        {
            config.emplace_back(full_key, value);
        }
    }

    return config;
}

ConfigEntries parse_yaml_file(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw ConfigError(filename, "could not open config file");
    }
    return parse_yaml_simple(file);
}

const std::string* find_config_value(const ConfigEntries& entries, const std::string& key)
{
    for (const auto& entry : entries)
    {
        if (entry.first == key)
        {
            return &entry.second;
        }
    }
    return nullptr;
}

ConfigEntries config_section(const ConfigEntries& entries, const std::string& prefix)
{
    ConfigEntries out;
    const std::string dotted = prefix + ".";
    for (const auto& entry : entries)
    {
        if (entry.first.compare(0, dotted.size(), dotted) == 0)
        {
            out.emplace_back(entry.first.substr(dotted.size()), entry.second);
        }
    }
    return out;
}

void apply_logging_config(const ConfigEntries& entries)
{
    if (const std::string* profile = find_config_value(entries, "logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "[CONFIG] Warning: Invalid logging.profile '" << *profile
                      << "'. Valid values: quiet, normal, debug. Keeping "
                      << log_profile_name(global_log_profile) << "." << std::endl;
        }
    }

    if (const char* env_log_profile = std::getenv("GCM_LOG_PROFILE"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "[CONFIG] Warning: Invalid GCM_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }
}

} // namespace gcm
