#pragma once

#include <optional>
#include <string>
#include <vector>

#include "collections.hpp"
#include "field_validation.hpp"
#include "planet.hpp"
#include "runtime_config.hpp"
#include "units.hpp"

/**
 * @file planet_builder.hpp
 * @brief Typed planet configuration and the config-to-Planet builder.
 *
 * Parsing checks each configuration section on its own and reports the
 * first bad key; building derives pressure, surface pressure, surface
 * temperature and the adiabat from the checked parameters.
 */

namespace gcm
{

struct GridSection
{
    int n_layer = 0;
    int n_lon = 0;
    int n_lat = 0;
};

struct PlanetSection
{
    Quantity teff_star;
    Quantity r_star;
    Quantity r_orbit;
    std::optional<double> albedo;
    std::optional<double> emissivity;
    double epsilon = 0.0;
    double gamma = 1.0;
    Quantity psurf;
    Quantity ptop;
    std::optional<Quantity> wind_u;
    std::optional<Quantity> wind_v;
};

struct PlanetConfig
{
    GridSection grid;
    PlanetSection planet;
    AbundanceMapping molecules;
    std::vector<AerosolEntry> aerosols;
    std::string description = default_atmosphere_description;
    ValidationPolicy validation;
};

/**
 * @brief Checks flattened config entries and returns the typed config.
 *
 * Recognised sections are `shape`, `planet`, `molecules`, `aerosols`,
 * `logging`, `output` and `validation`. Molecule and aerosol order
 * follows the entry order.
 *
 * @throws ConfigError for a missing, malformed or unrecognised key.
 * @throws UnitIncompatible when a quantity has the wrong dimension; the
 *         message names the key.
 * @throws UnknownSpecies for a gas or aerosol missing from the species tables.
 */
PlanetConfig parse_planet_config(const ConfigEntries& entries);

/**
 * @brief Builds a Planet from a checked configuration.
 *
 * The planet albedo, when given, serves both as the surface albedo map
 * and as the Bond albedo of the irradiation balance.
 */
Planet build_planet(const PlanetConfig& config);

} // namespace gcm
