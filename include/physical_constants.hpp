#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical and astronomical constants.
 *
 * Centralizes the SI values used by the unit table and by the
 * surface-temperature and adiabat derivations.
 */

namespace gcm
{
namespace physical_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double stefan_boltzmann_wm2k4 = 5.670374419e-8;

inline constexpr double astronomical_unit_m = 1.495978707e11;
inline constexpr double solar_radius_m = 6.957e8;
inline constexpr double earth_radius_m = 6.3781e6;
inline constexpr double jupiter_radius_m = 7.1492e7;
inline constexpr double parsec_m = 3.0856775814913673e16;

inline constexpr double bar_pa = 1.0e5;
inline constexpr double atmosphere_pa = 101325.0;

inline constexpr double julian_year_s = 365.25 * 86400.0;
} // namespace physical_constants
} // namespace gcm
