#pragma once

#include <stdexcept>
#include <string>

/**
 * @file gcm_errors.hpp
 * @brief Exception types raised while assembling a planet GCM.
 *
 * Every failure in the construction and composition paths is a
 * deterministic input error. Each kind has its own type so callers
 * can tell them apart; none of them is retried or downgraded.
 */

namespace gcm
{

/**
 * @brief Raised when pressure or surface pressure is absent.
 */
class MissingRequiredField : public std::invalid_argument
{
public:
    explicit MissingRequiredField(const std::string& field)
        : std::invalid_argument("required field '" + field + "' must be provided"),
          field_(field)
    {
    }

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * @brief Raised when a grid shape disagrees with the expected shape.
 */
class ShapeMismatch : public std::invalid_argument
{
public:
    explicit ShapeMismatch(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised when a quantity cannot be converted to the requested unit.
 */
class UnitIncompatible : public std::invalid_argument
{
public:
    explicit UnitIncompatible(const std::string& message) : std::invalid_argument(message) {}
};

/**
 * @brief Raised when a gas or aerosol name is missing from the species tables.
 */
class UnknownSpecies : public std::invalid_argument
{
public:
    UnknownSpecies(const std::string& kind, const std::string& name)
        : std::invalid_argument("unknown " + kind + " species '" + name + "'"),
          name_(name)
    {
    }

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

/**
 * @brief Raised for malformed or missing configuration entries.
 */
class ConfigError : public std::runtime_error
{
public:
    ConfigError(const std::string& key, const std::string& message)
        : std::runtime_error(key + ": " + message),
          key_(key)
    {
    }

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace gcm
