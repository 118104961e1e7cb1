#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "grid_field.hpp"
#include "units.hpp"

/**
 * @file collections.hpp
 * @brief Ordered field collections owned by a planet.
 *
 * Winds, Molecules and Aerosols group volume fields whose order is
 * load-bearing: it fixes both the variable order in the GCM header and
 * the concatenation order of the binary payload.
 */

namespace gcm
{

/**
 * @brief Insertion-ordered name to quantity mapping.
 */
using AbundanceMapping = std::vector<std::pair<std::string, Quantity>>;

struct AerosolEntry
{
    std::string name;
    Quantity abundance;
    Quantity size;
};

class Winds
{
public:
    Winds(Field wind_u, Field wind_v) : wind_u_(std::move(wind_u)), wind_v_(std::move(wind_v)) {}

    /**
     * @brief Builds uniform zonal (`U`) and meridional (`V`) winds.
     * @throws UnitIncompatible when a component is not a velocity.
     */
    static Winds constant(const Quantity& u, const Quantity& v, const GridShape& shape);

    const Field& wind_u() const { return wind_u_; }
    const Field& wind_v() const { return wind_v_; }

    /**
     * @brief Returns wind_u values followed by wind_v values.
     */
    std::vector<float> flat() const;

private:
    Field wind_u_;
    Field wind_v_;
};

class Molecules
{
public:
    /**
     * @throws std::invalid_argument when two molecules share a name.
     */
    explicit Molecules(std::vector<Field> molecules);

    /**
     * @brief Builds one constant-abundance field per gas, in mapping order.
     * @throws UnitIncompatible when an abundance is not dimensionless.
     */
    static Molecules from_mapping(const AbundanceMapping& abundances, const GridShape& shape);

    const std::vector<Field>& molecules() const { return molecules_; }
    std::vector<std::string> names() const;
    std::size_t size() const { return molecules_.size(); }
    bool empty() const { return molecules_.empty(); }

    /**
     * @brief Concatenates each molecule's values in collection order.
     */
    std::vector<float> flat() const;

private:
    std::vector<Field> molecules_;
};

class Aerosols
{
public:
    /**
     * @throws std::invalid_argument when the two lists differ in length, a
     *         size name is not `<abundance name>_size`, or a name repeats.
     */
    Aerosols(std::vector<Field> aerosols, std::vector<Field> sizes);

    /**
     * @brief Builds constant abundance and size fields, in mapping order.
     * @throws UnitIncompatible when an abundance is not a mass ratio or a
     *         size is not a length.
     */
    static Aerosols from_mapping(const std::vector<AerosolEntry>& entries, const GridShape& shape);

    const std::vector<Field>& aerosols() const { return aerosols_; }
    const std::vector<Field>& sizes() const { return sizes_; }
    std::vector<std::string> names() const;
    std::size_t size() const { return aerosols_.size(); }
    bool empty() const { return aerosols_.empty(); }

    /**
     * @brief Returns every abundance field's values, then every size field's.
     */
    std::vector<float> flat() const;

private:
    std::vector<Field> aerosols_;
    std::vector<Field> sizes_;
};

} // namespace gcm
