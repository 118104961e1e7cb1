/**
 * @file field_contract.cpp
 * @brief Implementation for the validation module.
 *
 * Holds the static contract table that ties each GCM variable kind to
 * its header name, declared unit, dimensionality and default bounds.
 * This file is part of the src/validation subsystem.
 */

#include "field_contract.hpp"

#include <stdexcept>

namespace gcm {
namespace {

/**
 * @brief Builds an inclusive min/max bounds descriptor.
 */
FieldBounds bounds(double min_value, double max_value) {
    FieldBounds out;
    out.has_min = true;
    out.has_max = true;
    out.min_value = min_value;
    out.max_value = max_value;
    return out;
}

const std::vector<FieldContract> kContracts = {
    {FieldKind::WindU, "wind_u", "U", "m/s", "Zonal wind", FieldDimensionality::Volume3D, {}},
    {FieldKind::WindV, "wind_v", "V", "m/s", "Meridional wind", FieldDimensionality::Volume3D, {}},
    {FieldKind::SurfaceTemperature, "tsurf", "Tsurf", "K", "Surface temperature",
     FieldDimensionality::Surface2D, bounds(0.0, 1.0e4)},
    {FieldKind::SurfacePressure, "psurf", "Psurf", "bar", "Surface pressure",
     FieldDimensionality::Surface2D, bounds(0.0, 1.0e5)},
    {FieldKind::Albedo, "albedo", "Albedo", "1", "Surface albedo",
     FieldDimensionality::Surface2D, bounds(0.0, 1.0)},
    {FieldKind::Emissivity, "emissivity", "Emissivity", "1", "Surface emissivity",
     FieldDimensionality::Surface2D, bounds(0.0, 1.0)},
    {FieldKind::Temperature, "temperature", "Temperature", "K", "Atmospheric temperature",
     FieldDimensionality::Volume3D, bounds(0.0, 1.0e4)},
    {FieldKind::Pressure, "pressure", "Pressure", "bar", "Layer pressure",
     FieldDimensionality::Volume3D, bounds(0.0, 1.0e5)},
    {FieldKind::Molecule, "molecule", "", "1", "Gas volume mixing ratio",
     FieldDimensionality::Volume3D, bounds(0.0, 1.0)},
    {FieldKind::Aerosol, "aerosol", "", "kg/kg", "Aerosol mass mixing ratio",
     FieldDimensionality::Volume3D, bounds(0.0, 1.0)},
    {FieldKind::AerosolSize, "aerosol_size", "", "m", "Aerosol effective particle size",
     FieldDimensionality::Volume3D, bounds(0.0, 1.0)},
};

}

const std::vector<FieldContract>& gcm_field_contracts() {
    return kContracts;
}

const FieldContract& contract_for(FieldKind kind) {
    for (const auto& contract : kContracts) {
        if (contract.kind == kind) {
            return contract;
        }
    }
    throw std::logic_error("no field contract for kind " + std::to_string(static_cast<int>(kind)));
}

Unit declared_unit(FieldKind kind) {
    return parse_unit(contract_for(kind).units);
}

const char* to_string(FieldDimensionality value) {
    switch (value) {
        case FieldDimensionality::Volume3D:
            return "volume_3d";
        case FieldDimensionality::Surface2D:
            return "surface_2d";
        default:
            return "unknown";
    }
}

const char* to_string(FieldKind kind) {
    return contract_for(kind).id.c_str();
}

}
