/**
 * @file structure.cpp
 * @brief Derived planet fields: pressure grid, surface maps, adiabat.
 *
 * Column loops run under OpenMP; every element is written by exactly one
 * iteration, so results do not depend on the thread count.
 */

#include "structure.hpp"

#include "gcm_errors.hpp"
#include "grid_axes.hpp"
#include "physical_constants.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace gcm
{
namespace
{

void require_rank(const FieldContract& contract, const GridShape& shape)
{
    const bool volume = contract.dimensionality == FieldDimensionality::Volume3D;
    if (volume != shape.is_volume())
    {
        throw ShapeMismatch(contract.id + " field must be " + to_string(contract.dimensionality) +
                            ", got shape " + shape.to_string());
    }
}

double deg_to_rad(double deg)
{
    return deg * physical_constants::pi / 180.0;
}

}

Field constant_field(FieldKind kind, const Quantity& value, const GridShape& shape, const std::string& name)
{
    const FieldContract& contract = contract_for(kind);
    require_rank(contract, shape);
    return Field::from_quantity(name.empty() ? contract.default_name : name, declared_unit(kind), value, shape);
}

Field pressure_from_limits(const Quantity& high, const Quantity& low, const GridShape& shape)
{
    const FieldContract& contract = contract_for(FieldKind::Pressure);
    require_rank(contract, shape);

    const Unit unit = declared_unit(FieldKind::Pressure);
    const double high_value = high.to(unit);
    const double low_value = low.to(unit);
    if (!(high_value > 0.0) || !(low_value > 0.0))
    {
        throw std::invalid_argument("pressure limits must be positive (psurf=" + high.to_string() +
                                    ", ptop=" + low.to_string() + ")");
    }
    if (low_value > high_value)
    {
        throw std::invalid_argument("top pressure " + low.to_string() + " exceeds surface pressure " +
                                    high.to_string());
    }

    const int n_layer = shape.extent(0);
    std::vector<double> profile(static_cast<std::size_t>(n_layer), high_value);
    if (n_layer > 1)
    {
        const double log_high = std::log10(high_value);
        const double log_step = (std::log10(low_value) - log_high) / static_cast<double>(n_layer - 1);
        for (int k = 0; k < n_layer; ++k)
        {
            profile[static_cast<std::size_t>(k)] = std::pow(10.0, log_high + log_step * static_cast<double>(k));
        }
        profile.back() = low_value;
    }

    return Field::broadcast(contract.default_name, unit, profile, {n_layer, 1, 1}, shape);
}

Field surface_pressure_from_pressure(const Field& pressure)
{
    const GridShape surface = pressure.shape().horizontal();
    const std::vector<float>& values = pressure.flat();
    const std::vector<double> base(values.begin(),
                                   values.begin() + static_cast<std::ptrdiff_t>(surface.element_count()));

    const Unit unit = declared_unit(FieldKind::SurfacePressure);
    const double factor = pressure.unit().conversion_factor_to(unit);
    std::vector<double> converted(base.size());
    std::transform(base.begin(), base.end(), converted.begin(), [factor](double v) { return v * factor; });

    return Field::from_values(contract_for(FieldKind::SurfacePressure).default_name, unit, converted, surface);
}

double substellar_temperature_k(const IrradiationParams& params)
{
    const double teff = params.star_teff.to("K");
    const double r_star = params.r_star.to("m");
    const double r_orbit = params.r_orbit.to("m");
    if (!(teff > 0.0))
    {
        throw std::invalid_argument("stellar effective temperature must be positive");
    }
    if (!(r_star > 0.0) || !(r_orbit > 0.0))
    {
        throw std::invalid_argument("stellar and orbital radii must be positive");
    }
    if (params.bond_albedo < 0.0 || params.bond_albedo > 1.0)
    {
        throw std::invalid_argument("bond albedo must lie in [0, 1], got " + std::to_string(params.bond_albedo));
    }
    return teff * std::sqrt(r_star / r_orbit) * std::pow(1.0 - params.bond_albedo, 0.25);
}

Field surface_temperature_from_irradiation(const GridShape& shape, const IrradiationParams& params)
{
    const FieldContract& contract = contract_for(FieldKind::SurfaceTemperature);
    require_rank(contract, shape);
    if (params.epsilon < 0.0 || !std::isfinite(params.epsilon))
    {
        throw std::invalid_argument("heat redistribution epsilon must be finite and non-negative");
    }

    const double t0 = substellar_temperature_k(params);
    const double t0_4 = t0 * t0 * t0 * t0;
    const double redistributed = params.epsilon / (1.0 + params.epsilon);

    const int n_lon = shape.extent(0);
    const int n_lat = shape.extent(1);
    const std::vector<double> lons = grid_axes::longitudes_deg(n_lon);
    const std::vector<double> lats = grid_axes::latitudes_deg(n_lat);

    std::vector<double> values(shape.element_count(), 0.0);
    #pragma omp parallel for collapse(2)
    for (int i = 0; i < n_lon; ++i)
    {
        for (int j = 0; j < n_lat; ++j)
        {
            const double cos_lat = std::max(0.0, std::cos(deg_to_rad(lats[static_cast<std::size_t>(j)])));
            const double cos_lon = std::cos(deg_to_rad(lons[static_cast<std::size_t>(i)]));
            const double dayside = std::max(0.0, cos_lat * cos_lon);
            const double band = cos_lat / physical_constants::pi;
            const double flux_factor = (1.0 - redistributed) * dayside + redistributed * band;
            values[static_cast<std::size_t>(i) * static_cast<std::size_t>(n_lat) + static_cast<std::size_t>(j)] =
                std::pow(t0_4 * flux_factor, 0.25);
        }
    }

    return Field::from_values(contract.default_name, declared_unit(FieldKind::SurfaceTemperature), values, shape);
}

Field temperature_from_adiabat(double gamma, const Field& tsurf, const Field& pressure)
{
    if (!(gamma >= 1.0) || !std::isfinite(gamma))
    {
        throw std::invalid_argument("adiabatic index gamma must be at least 1, got " + std::to_string(gamma));
    }
    const GridShape& shape = pressure.shape();
    const GridShape surface = shape.horizontal();
    if (tsurf.shape() != surface)
    {
        throw ShapeMismatch("surface temperature shape " + tsurf.shape().to_string() +
                            " does not match pressure columns " + surface.to_string());
    }

    const Unit unit = declared_unit(FieldKind::Temperature);
    const double tsurf_factor = tsurf.unit().conversion_factor_to(unit);
    const double exponent = (gamma - 1.0) / gamma;

    const int n_layer = shape.extent(0);
    const std::size_t columns = surface.element_count();
    const std::vector<float>& p = pressure.flat();
    const std::vector<float>& ts = tsurf.flat();

    std::vector<double> values(shape.element_count(), 0.0);
    #pragma omp parallel for
    for (long long c = 0; c < static_cast<long long>(columns); ++c)
    {
        const std::size_t col = static_cast<std::size_t>(c);
        const double p_surface = static_cast<double>(p[col]);
        const double t_surface = static_cast<double>(ts[col]) * tsurf_factor;
        for (int k = 0; k < n_layer; ++k)
        {
            const std::size_t idx = static_cast<std::size_t>(k) * columns + col;
            const double ratio = p_surface > 0.0 ? static_cast<double>(p[idx]) / p_surface : 0.0;
            values[idx] = t_surface * std::pow(ratio, exponent);
        }
    }

    return Field::from_values(contract_for(FieldKind::Temperature).default_name, unit, values, shape);
}

} // namespace gcm
