#pragma once

#include <string>

#include "field_contract.hpp"
#include "grid_field.hpp"
#include "units.hpp"

/**
 * @file structure.hpp
 * @brief Factories for the physically derived planet fields.
 *
 * Builds the vertical pressure grid, the surface pressure slice, an
 * irradiation-balance surface temperature map, and a dry-adiabat
 * temperature profile. Each factory returns a new immutable Field in its
 * kind's declared unit and name.
 */

namespace gcm
{

/**
 * @brief Builds a constant field of the given kind.
 *
 * An empty `name` selects the kind's default header name.
 *
 * @throws ShapeMismatch when the shape rank disagrees with the kind.
 * @throws UnitIncompatible when `value` cannot be expressed in the kind's unit.
 */
Field constant_field(FieldKind kind, const Quantity& value, const GridShape& shape, const std::string& name = "");

/**
 * @brief Log-spaced pressure from `high` at layer 0 to `low` at the top layer.
 *
 * Every column carries the same profile. A single-layer grid holds `high`.
 *
 * @throws std::invalid_argument when a bound is not positive or `low` exceeds `high`.
 * @throws UnitIncompatible when a bound is not a pressure.
 */
Field pressure_from_limits(const Quantity& high, const Quantity& low, const GridShape& shape);

/**
 * @brief Copies layer 0 of a pressure field into a surface-pressure field.
 */
Field surface_pressure_from_pressure(const Field& pressure);

struct IrradiationParams
{
    Quantity star_teff;
    Quantity r_star;
    Quantity r_orbit;
    double bond_albedo = 0.0;
    double epsilon = 0.0;
};

/**
 * @brief Substellar-point equilibrium temperature in kelvin.
 *
 * T0 = Teff * sqrt(R_star / a) * (1 - A)^(1/4).
 */
double substellar_temperature_k(const IrradiationParams& params);

/**
 * @brief Surface temperature map from stellar irradiation balance.
 *
 * With f = epsilon / (1 + epsilon) as the longitudinally redistributed
 * fraction of absorbed flux and the substellar point at (0, 0):
 *
 *   T^4 = T0^4 * ((1 - f) * max(cos(lat) cos(lon), 0) + f * cos(lat) / pi)
 *
 * epsilon = 0 gives a bare dayside; large epsilon gives latitude bands.
 *
 * @throws std::invalid_argument for a negative epsilon, an albedo outside
 *         [0, 1], or non-positive radii or temperature.
 * @throws UnitIncompatible when a parameter carries the wrong dimension.
 */
Field surface_temperature_from_irradiation(const GridShape& shape, const IrradiationParams& params);

/**
 * @brief Dry-adiabat temperature anchored at the surface.
 *
 * T(k,i,j) = Tsurf(i,j) * (P(k,i,j) / P(0,i,j))^((gamma - 1) / gamma)
 *
 * @throws std::invalid_argument when gamma is below 1.
 * @throws ShapeMismatch when tsurf is not the horizontal shape of pressure.
 */
Field temperature_from_adiabat(double gamma, const Field& tsurf, const Field& pressure);

} // namespace gcm
