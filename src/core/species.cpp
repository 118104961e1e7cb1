/**
 * @file species.cpp
 * @brief Gas and aerosol species tables.
 *
 * HITRAN molecule ids for line-list gases, and fixed database labels
 * for cross-section, collision-induced and aerosol opacity sources.
 */

#include "species.hpp"

#include "gcm_errors.hpp"

namespace gcm
{

GasType gas_type(GasSpecies species)
{
    switch (species)
    {
        case GasSpecies::H2: return {true, 45, "H2"};
        case GasSpecies::He: return {true, 0, "He"};
        case GasSpecies::H2O: return {true, 1, "H2O"};
        case GasSpecies::CO2: return {true, 2, "CO2"};
        case GasSpecies::O3: return {true, 3, "O3"};
        case GasSpecies::N2O: return {true, 4, "N2O"};
        case GasSpecies::CO: return {true, 5, "CO"};
        case GasSpecies::CH4: return {true, 6, "CH4"};
        case GasSpecies::O2: return {true, 7, "O2"};
        case GasSpecies::NO: return {true, 8, "NO"};
        case GasSpecies::SO2: return {true, 9, "SO2"};
        case GasSpecies::NO2: return {true, 10, "NO2"};
        case GasSpecies::NH3: return {true, 11, "NH3"};
        case GasSpecies::HNO3: return {true, 12, "HNO3"};
        case GasSpecies::OH: return {true, 13, "OH"};
        case GasSpecies::N2: return {true, 22, "N2"};
        case GasSpecies::HO2NO2: return {false, 0, "SEC[26404-66-0] Peroxynitric acid"};
        case GasSpecies::N2O5: return {false, 0, "XSEC[10102-03-1] Dinitrogen pentoxide"};
        case GasSpecies::O: return {false, 0, "KZ[08] Oxygen"};
        case GasSpecies::HF: return {true, 14, "HF"};
        case GasSpecies::HCl: return {true, 15, "HCl"};
        case GasSpecies::HBr: return {true, 16, "HBr"};
        case GasSpecies::HI: return {true, 17, "HI"};
        case GasSpecies::ClO: return {true, 18, "ClO"};
        case GasSpecies::OCS: return {true, 19, "OCS"};
        case GasSpecies::H2CO: return {true, 20, "H2CO"};
        case GasSpecies::HOCl: return {true, 21, "HOCl"};
        case GasSpecies::HCN: return {true, 23, "HCN"};
        case GasSpecies::CH3Cl: return {true, 24, "CH3Cl"};
        case GasSpecies::H2O2: return {true, 25, "H2O2"};
        case GasSpecies::C2H2: return {true, 26, "C2H2"};
        case GasSpecies::C2H6: return {true, 27, "C2H6"};
        case GasSpecies::PH3: return {true, 28, "PH3"};
        case GasSpecies::COF2: return {true, 29, "COF2"};
        case GasSpecies::SF6: return {true, 30, "SF6"};
        case GasSpecies::H2S: return {true, 31, "H2S"};
        case GasSpecies::HCOOH: return {true, 32, "HCOOH"};
        case GasSpecies::HO2: return {true, 33, "HO2"};
        case GasSpecies::ClONO2: return {true, 35, "ClONO2"};
        case GasSpecies::HOBr: return {true, 37, "HOBr"};
        case GasSpecies::C2H4: return {true, 38, "C2H4"};
        case GasSpecies::CH3OH: return {true, 39, "CH3OH"};
        case GasSpecies::CH3Br: return {true, 40, "CH3Br"};
        case GasSpecies::CH3CN: return {true, 41, "CH3CN"};
        case GasSpecies::CF4: return {true, 42, "CF4"};
        case GasSpecies::C4H2: return {true, 43, "C4H2"};
        case GasSpecies::HC3N: return {true, 44, "HC3N"};
        case GasSpecies::CS: return {true, 46, "CS"};
        case GasSpecies::SO3: return {true, 47, "SO3"};
    }
    throw UnknownSpecies("gas", std::to_string(static_cast<int>(species)));
}

std::string gas_type_token(GasSpecies species)
{
    const GasType type = gas_type(species);
    if (type.hitran)
    {
        return "HIT[" + std::to_string(type.hitran_id) + "]";
    }
    return type.label;
}

const char* aerosol_type_token(AerosolSpecies species)
{
    switch (species)
    {
        case AerosolSpecies::Water: return "AFCRL_WATER_HRI";
        case AerosolSpecies::WaterIce: return "Warren_ICE_IRI";
    }
    throw UnknownSpecies("aerosol", std::to_string(static_cast<int>(species)));
}

const char* to_string(GasSpecies species)
{
    switch (species)
    {
        case GasSpecies::H2: return "H2";
        case GasSpecies::He: return "He";
        case GasSpecies::H2O: return "H2O";
        case GasSpecies::CO2: return "CO2";
        case GasSpecies::O3: return "O3";
        case GasSpecies::N2O: return "N2O";
        case GasSpecies::CO: return "CO";
        case GasSpecies::CH4: return "CH4";
        case GasSpecies::O2: return "O2";
        case GasSpecies::NO: return "NO";
        case GasSpecies::SO2: return "SO2";
        case GasSpecies::NO2: return "NO2";
        case GasSpecies::NH3: return "NH3";
        case GasSpecies::HNO3: return "HNO3";
        case GasSpecies::OH: return "OH";
        case GasSpecies::N2: return "N2";
        case GasSpecies::HO2NO2: return "HO2NO2";
        case GasSpecies::N2O5: return "N2O5";
        case GasSpecies::O: return "O";
        case GasSpecies::HF: return "HF";
        case GasSpecies::HCl: return "HCl";
        case GasSpecies::HBr: return "HBr";
        case GasSpecies::HI: return "HI";
        case GasSpecies::ClO: return "ClO";
        case GasSpecies::OCS: return "OCS";
        case GasSpecies::H2CO: return "H2CO";
        case GasSpecies::HOCl: return "HOCl";
        case GasSpecies::HCN: return "HCN";
        case GasSpecies::CH3Cl: return "CH3Cl";
        case GasSpecies::H2O2: return "H2O2";
        case GasSpecies::C2H2: return "C2H2";
        case GasSpecies::C2H6: return "C2H6";
        case GasSpecies::PH3: return "PH3";
        case GasSpecies::COF2: return "COF2";
        case GasSpecies::SF6: return "SF6";
        case GasSpecies::H2S: return "H2S";
        case GasSpecies::HCOOH: return "HCOOH";
        case GasSpecies::HO2: return "HO2";
        case GasSpecies::ClONO2: return "ClONO2";
        case GasSpecies::HOBr: return "HOBr";
        case GasSpecies::C2H4: return "C2H4";
        case GasSpecies::CH3OH: return "CH3OH";
        case GasSpecies::CH3Br: return "CH3Br";
        case GasSpecies::CH3CN: return "CH3CN";
        case GasSpecies::CF4: return "CF4";
        case GasSpecies::C4H2: return "C4H2";
        case GasSpecies::HC3N: return "HC3N";
        case GasSpecies::CS: return "CS";
        case GasSpecies::SO3: return "SO3";
    }
    return "unknown";
}

const char* to_string(AerosolSpecies species)
{
    switch (species)
    {
        case AerosolSpecies::Water: return "Water";
        case AerosolSpecies::WaterIce: return "WaterIce";
    }
    return "unknown";
}

const std::vector<GasSpecies>& all_gas_species()
{
    static const std::vector<GasSpecies> species = {
        GasSpecies::H2, GasSpecies::He, GasSpecies::H2O, GasSpecies::CO2, GasSpecies::O3,
        GasSpecies::N2O, GasSpecies::CO, GasSpecies::CH4, GasSpecies::O2, GasSpecies::NO,
        GasSpecies::SO2, GasSpecies::NO2, GasSpecies::NH3, GasSpecies::HNO3, GasSpecies::OH,
        GasSpecies::N2, GasSpecies::HO2NO2, GasSpecies::N2O5, GasSpecies::O,
        GasSpecies::HF, GasSpecies::HCl, GasSpecies::HBr, GasSpecies::HI, GasSpecies::ClO, GasSpecies::OCS,
        GasSpecies::H2CO, GasSpecies::HOCl, GasSpecies::HCN, GasSpecies::CH3Cl, GasSpecies::H2O2,
        GasSpecies::C2H2, GasSpecies::C2H6, GasSpecies::PH3, GasSpecies::COF2, GasSpecies::SF6,
        GasSpecies::H2S, GasSpecies::HCOOH, GasSpecies::HO2, GasSpecies::ClONO2, GasSpecies::HOBr,
        GasSpecies::C2H4, GasSpecies::CH3OH, GasSpecies::CH3Br, GasSpecies::CH3CN, GasSpecies::CF4,
        GasSpecies::C4H2, GasSpecies::HC3N, GasSpecies::CS, GasSpecies::SO3,
    };
    return species;
}

const std::vector<AerosolSpecies>& all_aerosol_species()
{
    static const std::vector<AerosolSpecies> species = {
        AerosolSpecies::Water,
        AerosolSpecies::WaterIce,
    };
    return species;
}

GasSpecies parse_gas_species(const std::string& name)
{
    for (GasSpecies species : all_gas_species())
    {
        if (name == to_string(species))
        {
            return species;
        }
    }
    throw UnknownSpecies("gas", name);
}

AerosolSpecies parse_aerosol_species(const std::string& name)
{
    for (AerosolSpecies species : all_aerosol_species())
    {
        if (name == to_string(species))
        {
            return species;
        }
    }
    throw UnknownSpecies("aerosol", name);
}

} // namespace gcm
