#pragma once

#include <string>
#include <vector>

#include "units.hpp"

/**
 * @file field_contract.hpp
 * @brief Field metadata contract for every GCM variable kind.
 *
 * Captures the default header name, declared unit, dimensionality, and
 * physical bounds expected for each kind of field a planet can carry.
 * Factories use the contract to pick units; validation uses the bounds.
 */

namespace gcm
{

enum class FieldDimensionality
{
    Volume3D,
    Surface2D,
};

enum class FieldKind
{
    WindU,
    WindV,
    SurfaceTemperature,
    SurfacePressure,
    Albedo,
    Emissivity,
    Temperature,
    Pressure,
    Molecule,
    Aerosol,
    AerosolSize,
};

struct FieldBounds
{
    bool has_min = false;
    bool has_max = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

struct FieldContract
{
    FieldKind kind = FieldKind::Pressure;
    std::string id;
    std::string default_name;
    std::string units;
    std::string description;
    FieldDimensionality dimensionality = FieldDimensionality::Volume3D;
    FieldBounds default_bounds{};
};

/**
 * @brief Returns the complete field contract table.
 * @return Immutable list of field contracts, one per kind.
 */
const std::vector<FieldContract>& gcm_field_contracts();

/**
 * @brief Returns the contract for a field kind.
 */
const FieldContract& contract_for(FieldKind kind);

/**
 * @brief Returns the declared unit of a field kind.
 */
Unit declared_unit(FieldKind kind);

/**
 * @brief Suffix appended to an aerosol name to form its size-field name.
 */
inline constexpr const char* aerosol_size_suffix = "_size";

/**
 * @brief Converts dimensionality enum to text.
 */
const char* to_string(FieldDimensionality value);

/**
 * @brief Converts field kind enum to its contract id.
 */
const char* to_string(FieldKind kind);

} // namespace gcm
