#pragma once

#include <string>
#include <vector>

/**
 * @file species.hpp
 * @brief Closed gas and aerosol species tables for the PSG header.
 *
 * Every species the header can name is an enumerator; the type strings
 * are produced by exhaustive switches. Parsing a name that is not in the
 * table raises gcm::UnknownSpecies.
 */

namespace gcm
{

enum class GasSpecies
{
    H2,
    He,
    H2O,
    CO2,
    O3,
    N2O,
    CO,
    CH4,
    O2,
    NO,
    SO2,
    NO2,
    NH3,
    HNO3,
    OH,
    N2,
    HO2NO2,
    N2O5,
    O,
    HF,
    HCl,
    HBr,
    HI,
    ClO,
    OCS,
    H2CO,
    HOCl,
    HCN,
    CH3Cl,
    H2O2,
    C2H2,
    C2H6,
    PH3,
    COF2,
    SF6,
    H2S,
    HCOOH,
    HO2,
    ClONO2,
    HOBr,
    C2H4,
    CH3OH,
    CH3Br,
    CH3CN,
    CF4,
    C4H2,
    HC3N,
    CS,
    SO3,
};

enum class AerosolSpecies
{
    Water,
    WaterIce,
};

/**
 * @brief Opacity source used for a gas in the radiative-transfer database.
 */
struct GasType
{
    bool hitran = false;
    int hitran_id = 0;
    const char* label = "";
};

/**
 * @brief Returns the opacity source for a gas.
 */
GasType gas_type(GasSpecies species);

/**
 * @brief Formats the header token for a gas: `HIT[<id>]` or the fixed label.
 */
std::string gas_type_token(GasSpecies species);

/**
 * @brief Returns the optical-constant database token for an aerosol.
 */
const char* aerosol_type_token(AerosolSpecies species);

const char* to_string(GasSpecies species);
const char* to_string(AerosolSpecies species);

/**
 * @brief Resolves a gas by its header name (case-sensitive).
 * @throws UnknownSpecies when the name is not a known gas.
 */
GasSpecies parse_gas_species(const std::string& name);

/**
 * @brief Resolves an aerosol by its header name (case-sensitive).
 * @throws UnknownSpecies when the name is not a known aerosol.
 */
AerosolSpecies parse_aerosol_species(const std::string& name);

/**
 * @brief Lists every gas in declaration order.
 */
const std::vector<GasSpecies>& all_gas_species();

/**
 * @brief Lists every aerosol in declaration order.
 */
const std::vector<AerosolSpecies>& all_aerosol_species();

} // namespace gcm
