/**
 * @file planet_builder.cpp
 * @brief Section-wise configuration checks and planet assembly.
 *
 * Each configuration section is checked against its own key set before
 * any field is built, so a bad file fails with the offending key rather
 * than deep inside a field factory.
 */

#include "planet_builder.hpp"

#include "field_contract.hpp"
#include "gcm_errors.hpp"
#include "logging.hpp"
#include "species.hpp"
#include "structure.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace gcm
{
namespace
{

const std::vector<std::string> kSections = {
    "shape", "planet", "molecules", "aerosols", "logging", "output", "validation",
};

const std::vector<std::string> kShapeKeys = {"nlayer", "nlon", "nlat"};

const std::vector<std::string> kPlanetKeys = {
    "teff_star", "r_star", "r_orbit", "albedo", "emissivity", "epsilon", "gamma",
    "pressure.psurf", "pressure.ptop", "wind.U", "wind.V",
};

bool contains(const std::vector<std::string>& keys, const std::string& key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

std::string head_of(const std::string& key)
{
    return key.substr(0, key.find('.'));
}

/**
 * @brief Rejects keys of a section that are not in `allowed`.
 */
void require_known_keys(const ConfigEntries& section, const std::string& prefix,
                        const std::vector<std::string>& allowed)
{
    for (const auto& entry : section)
    {
        if (!contains(allowed, entry.first))
        {
            throw ConfigError(prefix + "." + entry.first, "unrecognised key");
        }
    }
}

const std::string& require_value(const ConfigEntries& entries, const std::string& key)
{
    const std::string* value = find_config_value(entries, key);
    if (value == nullptr || value->empty())
    {
        throw ConfigError(key, "missing required value");
    }
    return *value;
}

/**
 * @brief Parses a quantity and checks that it converts to `expected_unit`.
 */
Quantity parse_quantity_key(const std::string& key, const std::string& text, const std::string& expected_unit)
{
    Quantity quantity;
    try
    {
        quantity = parse_quantity(text);
    }
    catch (const UnitIncompatible& e)
    {
        throw UnitIncompatible(key + ": " + e.what());
    }
    catch (const std::invalid_argument& e)
    {
        throw ConfigError(key, e.what());
    }

    if (!quantity.unit.convertible_to(parse_unit(expected_unit)))
    {
        const std::string given = quantity.unit.symbol().empty() ? "dimensionless" : quantity.unit.symbol();
        throw UnitIncompatible(key + ": expected a quantity convertible to '" + expected_unit + "', got '" +
                               given + "'");
    }
    return quantity;
}

Quantity require_quantity(const ConfigEntries& entries, const std::string& key, const std::string& expected_unit)
{
    return parse_quantity_key(key, require_value(entries, key), expected_unit);
}

std::optional<double> optional_fraction(const ConfigEntries& entries, const std::string& key)
{
    const std::string* text = find_config_value(entries, key);
    if (text == nullptr)
    {
        return std::nullopt;
    }
    const double value = parse_quantity_key(key, *text, "1").to("1");
    if (value < 0.0 || value > 1.0)
    {
        throw ConfigError(key, "must lie in [0, 1], got '" + *text + "'");
    }
    return value;
}

double require_double(const ConfigEntries& entries, const std::string& key)
{
    const std::string& text = require_value(entries, key);
    double value = 0.0;
    if (!try_parse_double_value(text, value))
    {
        throw ConfigError(key, "expected a number, got '" + text + "'");
    }
    return value;
}

GridSection parse_shape_section(const ConfigEntries& entries)
{
    require_known_keys(config_section(entries, "shape"), "shape", kShapeKeys);

    GridSection grid;
    int* targets[] = {&grid.n_layer, &grid.n_lon, &grid.n_lat};
    for (std::size_t i = 0; i < kShapeKeys.size(); ++i)
    {
        const std::string key = "shape." + kShapeKeys[i];
        const std::string& text = require_value(entries, key);
        if (!try_parse_positive_int_value(text, *targets[i]))
        {
            throw ConfigError(key, "expected a positive integer, got '" + text + "'");
        }
    }
    return grid;
}

PlanetSection parse_planet_section(const ConfigEntries& entries)
{
    require_known_keys(config_section(entries, "planet"), "planet", kPlanetKeys);

    PlanetSection planet;
    planet.teff_star = require_quantity(entries, "planet.teff_star", "K");
    planet.r_star = require_quantity(entries, "planet.r_star", "m");
    planet.r_orbit = require_quantity(entries, "planet.r_orbit", "m");
    if (!(planet.teff_star.to("K") > 0.0))
    {
        throw ConfigError("planet.teff_star", "must be positive");
    }
    if (!(planet.r_star.to("m") > 0.0))
    {
        throw ConfigError("planet.r_star", "must be positive");
    }
    if (!(planet.r_orbit.to("m") > 0.0))
    {
        throw ConfigError("planet.r_orbit", "must be positive");
    }

    planet.albedo = optional_fraction(entries, "planet.albedo");
    planet.emissivity = optional_fraction(entries, "planet.emissivity");

    planet.epsilon = require_double(entries, "planet.epsilon");
    if (planet.epsilon < 0.0)
    {
        throw ConfigError("planet.epsilon", "must be non-negative");
    }
    planet.gamma = require_double(entries, "planet.gamma");
    if (planet.gamma < 1.0)
    {
        throw ConfigError("planet.gamma", "must be at least 1");
    }

    // planet.pressure
    planet.psurf = require_quantity(entries, "planet.pressure.psurf", "bar");
    planet.ptop = require_quantity(entries, "planet.pressure.ptop", "bar");
    const double psurf_bar = planet.psurf.to("bar");
    const double ptop_bar = planet.ptop.to("bar");
    if (!(psurf_bar > 0.0))
    {
        throw ConfigError("planet.pressure.psurf", "must be positive");
    }
    if (!(ptop_bar > 0.0))
    {
        throw ConfigError("planet.pressure.ptop", "must be positive");
    }
    if (ptop_bar > psurf_bar)
    {
        throw ConfigError("planet.pressure.ptop", "must not exceed planet.pressure.psurf");
    }

    // planet.wind: both components or neither
    const bool has_u = find_config_value(entries, "planet.wind.U") != nullptr;
    const bool has_v = find_config_value(entries, "planet.wind.V") != nullptr;
    if (has_u || has_v)
    {
        planet.wind_u = require_quantity(entries, "planet.wind.U", "m/s");
        planet.wind_v = require_quantity(entries, "planet.wind.V", "m/s");
    }
    return planet;
}

AbundanceMapping parse_molecules_section(const ConfigEntries& entries)
{
    AbundanceMapping molecules;
    for (const auto& entry : config_section(entries, "molecules"))
    {
        const std::string key = "molecules." + entry.first;
        if (entry.first.find('.') != std::string::npos)
        {
            throw ConfigError(key, "molecule entries take a single abundance value");
        }
        parse_gas_species(entry.first);
        const Quantity abundance = parse_quantity_key(key, entry.second, "1");
        if (abundance.to("1") < 0.0)
        {
            throw ConfigError(key, "abundance must be non-negative");
        }
        molecules.emplace_back(entry.first, abundance);
    }
    return molecules;
}

std::vector<AerosolEntry> parse_aerosols_section(const ConfigEntries& entries)
{
    const ConfigEntries section = config_section(entries, "aerosols");

    std::vector<std::string> names;
    for (const auto& entry : section)
    {
        const std::size_t dot = entry.first.find('.');
        const std::string field = dot == std::string::npos ? std::string() : entry.first.substr(dot + 1);
        if (dot == std::string::npos || (field != "abn" && field != "size"))
        {
            throw ConfigError("aerosols." + entry.first, "expected aerosols.<name>.abn or aerosols.<name>.size");
        }
        const std::string name = entry.first.substr(0, dot);
        if (!contains(names, name))
        {
            parse_aerosol_species(name);
            names.push_back(name);
        }
    }

    std::vector<AerosolEntry> aerosols;
    aerosols.reserve(names.size());
    for (const std::string& name : names)
    {
        AerosolEntry aerosol;
        aerosol.name = name;
        aerosol.abundance = require_quantity(entries, "aerosols." + name + ".abn", "kg/kg");
        aerosol.size = require_quantity(entries, "aerosols." + name + ".size", "m");
        if (aerosol.abundance.to("kg/kg") < 0.0)
        {
            throw ConfigError("aerosols." + name + ".abn", "abundance must be non-negative");
        }
        if (!(aerosol.size.to("m") > 0.0))
        {
            throw ConfigError("aerosols." + name + ".size", "particle size must be positive");
        }
        aerosols.push_back(std::move(aerosol));
    }
    return aerosols;
}

/**
 * @brief Splits `field_overrides.<field>.(min|max)` into its field and bound.
 */
bool parse_override_key(const std::string& key, std::string& field_out, bool& is_min_out)
{
    const std::string prefix = "field_overrides.";
    if (key.rfind(prefix, 0) != 0)
    {
        return false;
    }
    const std::string tail = key.substr(prefix.size());
    const std::size_t dot = tail.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 >= tail.size())
    {
        return false;
    }
    field_out = tail.substr(0, dot);
    const std::string bound = tail.substr(dot + 1);
    if (bound != "min" && bound != "max")
    {
        return false;
    }
    is_min_out = bound == "min";
    return true;
}

// An override starts from the contract it names so a lone `max` keeps the default `min`.
FieldBounds override_seed(const std::string& field)
{
    for (const FieldContract& contract : gcm_field_contracts())
    {
        if (contract.id == field || (!contract.default_name.empty() && contract.default_name == field))
        {
            return contract.default_bounds;
        }
    }
    return FieldBounds{};
}

ValidationPolicy parse_validation_section(const ConfigEntries& entries)
{
    ValidationPolicy policy;
    for (const auto& entry : config_section(entries, "validation"))
    {
        const std::string key = "validation." + entry.first;
        if (entry.first == "mode" || entry.first == "fail_on")
        {
            continue;
        }
        std::string field;
        bool is_min = true;
        if (!parse_override_key(entry.first, field, is_min))
        {
            throw ConfigError(key, "unrecognised key");
        }
        double value = 0.0;
        if (!try_parse_double_value(entry.second, value))
        {
            throw ConfigError(key, "expected a number, got '" + entry.second + "'");
        }
        auto inserted = policy.field_overrides.emplace(field, override_seed(field));
        FieldBounds& bounds = inserted.first->second;
        if (is_min)
        {
            bounds.has_min = true;
            bounds.min_value = value;
        }
        else
        {
            bounds.has_max = true;
            bounds.max_value = value;
        }
    }
    for (const auto& item : policy.field_overrides)
    {
        const FieldBounds& bounds = item.second;
        if (bounds.has_min && bounds.has_max && bounds.min_value > bounds.max_value)
        {
            throw ConfigError("validation.field_overrides." + item.first, "min must not exceed max");
        }
    }

    if (const std::string* mode = find_config_value(entries, "validation.mode"))
    {
        if (!parse_guard_mode(*mode, policy.mode))
        {
            throw ConfigError("validation.mode", "expected off, report or strict, got '" + *mode + "'");
        }
    }
    if (const std::string* fail_on = find_config_value(entries, "validation.fail_on"))
    {
        if (!parse_guard_fail_on(*fail_on, policy.fail_on))
        {
            throw ConfigError("validation.fail_on", "expected nonfinite, bounds or both, got '" + *fail_on + "'");
        }
    }
    return policy;
}

}

PlanetConfig parse_planet_config(const ConfigEntries& entries)
{
    for (const auto& entry : entries)
    {
        if (!contains(kSections, head_of(entry.first)))
        {
            throw ConfigError(entry.first, "unrecognised section '" + head_of(entry.first) + "'");
        }
    }

    PlanetConfig config;
    config.grid = parse_shape_section(entries);
    config.planet = parse_planet_section(entries);
    config.molecules = parse_molecules_section(entries);
    config.aerosols = parse_aerosols_section(entries);

    require_known_keys(config_section(entries, "logging"), "logging", {"profile"});
    require_known_keys(config_section(entries, "output"), "output", {"description"});
    if (const std::string* description = find_config_value(entries, "output.description"))
    {
        config.description = *description;
    }
    config.validation = parse_validation_section(entries);
    return config;
}

Planet build_planet(const PlanetConfig& config)
{
    const GridShape shape3d = GridShape::volume(config.grid.n_layer, config.grid.n_lon, config.grid.n_lat);
    const GridShape shape2d = shape3d.horizontal();
    const PlanetSection& params = config.planet;

    if (log_normal_enabled())
    {
        std::cout << "[BUILD] Planet grid " << shape3d.to_string()
                  << " with " << config.molecules.size() << " gas(es) and "
                  << config.aerosols.size() << " aerosol(s)" << std::endl;
    }

    PlanetComponents parts;
    parts.description = config.description;

    Field pressure = pressure_from_limits(params.psurf, params.ptop, shape3d);
    parts.psurf = surface_pressure_from_pressure(pressure);

    IrradiationParams irradiation;
    irradiation.star_teff = params.teff_star;
    irradiation.r_star = params.r_star;
    irradiation.r_orbit = params.r_orbit;
    irradiation.bond_albedo = params.albedo.value_or(0.0);
    irradiation.epsilon = params.epsilon;

    Field tsurf = surface_temperature_from_irradiation(shape2d, irradiation);
    parts.temperature = temperature_from_adiabat(params.gamma, tsurf, pressure);
    if (log_debug_enabled())
    {
        std::cout << "[BUILD] Substellar temperature " << substellar_temperature_k(irradiation)
                  << " K, epsilon=" << params.epsilon << ", gamma=" << params.gamma << std::endl;
    }
    parts.tsurf = std::move(tsurf);
    parts.pressure = std::move(pressure);

    if (params.wind_u && params.wind_v)
    {
        parts.wind = Winds::constant(*params.wind_u, *params.wind_v, shape3d);
    }
    if (params.albedo)
    {
        parts.albedo = constant_field(FieldKind::Albedo, Quantity(*params.albedo, Unit::dimensionless()), shape2d);
    }
    if (params.emissivity)
    {
        parts.emissivity =
            constant_field(FieldKind::Emissivity, Quantity(*params.emissivity, Unit::dimensionless()), shape2d);
    }
    if (!config.molecules.empty())
    {
        parts.molecules = Molecules::from_mapping(config.molecules, shape3d);
    }
    if (!config.aerosols.empty())
    {
        parts.aerosols = Aerosols::from_mapping(config.aerosols, shape3d);
    }

    Planet planet(std::move(parts));
    if (log_debug_enabled())
    {
        std::cout << "[BUILD] GCM parameters: " << planet.gcm_properties() << std::endl;
    }
    return planet;
}

} // namespace gcm
