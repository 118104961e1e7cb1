#pragma once

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"

/**
 * @file runtime_config.hpp
 * @brief Configuration file parsing and value helpers.
 *
 * Reads the indented YAML-like configuration format into dotted keys
 * (`planet.pressure.psurf`) while preserving file order, which the
 * builder relies on for molecule and aerosol ordering.
 */

namespace gcm
{

/**
 * @brief Flattened configuration entries in file order.
 */
using ConfigEntries = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and positive result.
 */
bool try_parse_positive_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses simple key-value YAML from a stream.
 *
 * Nested sections use two-space indentation; `#` starts a comment.
 * A repeated key keeps its first position and takes the last value.
 *
 * @param input Source stream.
 * @return Flattened entries in file order.
 */
ConfigEntries parse_yaml_simple(std::istream& input);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Flattened entries in file order.
 * @throws ConfigError when the file cannot be opened.
 */
ConfigEntries parse_yaml_file(const std::string& filename);

/**
 * @brief Looks up a key.
 * @return Pointer to the value, or null when the key is absent.
 */
const std::string* find_config_value(const ConfigEntries& entries, const std::string& key);

/**
 * @brief Returns the entries under `prefix.`, with the prefix stripped.
 */
ConfigEntries config_section(const ConfigEntries& entries, const std::string& prefix);

/**
 * @brief Applies `logging.profile` and the GCM_LOG_PROFILE override.
 *
 * The environment variable wins over the file. Invalid values emit a
 * warning and keep the current profile.
 */
void apply_logging_config(const ConfigEntries& entries);

} // namespace gcm
