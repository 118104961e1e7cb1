#pragma once

#include <cstddef>
#include <vector>

/**
 * @file grid_axes.hpp
 * @brief Longitude/latitude axes of the GCM mesh.
 *
 * Longitudes cover the half-open range [-180, 180) and latitudes the
 * closed range [-90, 90], both in degrees. Spacings follow the header
 * convention: dlon = 360/n_lon and dlat = 180/n_lat.
 */

namespace gcm
{
namespace grid_axes
{

inline constexpr double lon_origin_deg = -180.0;
inline constexpr double lat_origin_deg = -90.0;

/**
 * @brief Returns `n_lon` evenly spaced longitudes starting at -180.
 */
inline std::vector<double> longitudes_deg(int n_lon)
{
    std::vector<double> out;
    if (n_lon <= 0)
    {
        return out;
    }
    out.reserve(static_cast<std::size_t>(n_lon));
    const double step = 360.0 / static_cast<double>(n_lon);
    for (int i = 0; i < n_lon; ++i)
    {
        out.push_back(lon_origin_deg + step * static_cast<double>(i));
    }
    return out;
}

/**
 * @brief Returns `n_lat` evenly spaced latitudes from -90 to 90 inclusive.
 */
inline std::vector<double> latitudes_deg(int n_lat)
{
    std::vector<double> out;
    if (n_lat <= 0)
    {
        return out;
    }
    out.reserve(static_cast<std::size_t>(n_lat));
    if (n_lat == 1)
    {
        out.push_back(lat_origin_deg);
        return out;
    }
    const double step = 180.0 / static_cast<double>(n_lat - 1);
    for (int j = 0; j < n_lat - 1; ++j)
    {
        out.push_back(lat_origin_deg + step * static_cast<double>(j));
    }
    out.push_back(90.0);
    return out;
}

inline double longitude_spacing_deg(int n_lon)
{
    return 360.0 / static_cast<double>(n_lon);
}

inline double latitude_spacing_deg(int n_lat)
{
    return 180.0 / static_cast<double>(n_lat);
}

} // namespace grid_axes
} // namespace gcm
