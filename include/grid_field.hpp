#pragma once

#include <cassert>
#include <cstddef>
#include <string>
#include <vector>

#include "units.hpp"

/**
 * @file grid_field.hpp
 * @brief Immutable, named, unit-tagged float grid on the GCM mesh.
 *
 * A field is sampled either on the surface `(n_lon, n_lat)` or on the
 * volume `(n_layer, n_lon, n_lat)`. Storage is contiguous row-major
 * (last axis fastest) float32 in the field's declared unit. Instances are
 * produced by factory functions and never mutated afterwards.
 */

namespace gcm
{

class GridShape
{
public:
    GridShape() = default;

    /**
     * @brief Builds a shape from explicit extents.
     * @throws ShapeMismatch for a rank other than 2 or 3, a non-positive
     *         extent, or an element count that overflows size_t.
     */
    explicit GridShape(std::vector<int> dims);

    static GridShape surface(int n_lon, int n_lat) { return GridShape({n_lon, n_lat}); }
    static GridShape volume(int n_layer, int n_lon, int n_lat) { return GridShape({n_layer, n_lon, n_lat}); }

    std::size_t rank() const { return dims_.size(); }
    bool is_surface() const { return dims_.size() == 2; }
    bool is_volume() const { return dims_.size() == 3; }

    int extent(std::size_t axis) const { return dims_.at(axis); }
    const std::vector<int>& dims() const { return dims_; }

    /**
     * @brief Returns the trailing `(n_lon, n_lat)` shape of a volume shape.
     */
    GridShape horizontal() const;

    std::size_t element_count() const { return count_; }

    /**
     * @brief Formats the shape as `(a, b, c)`.
     */
    std::string to_string() const;

    bool operator==(const GridShape& other) const { return dims_ == other.dims_; }
    bool operator!=(const GridShape& other) const { return dims_ != other.dims_; }

private:
    std::vector<int> dims_;
    std::size_t count_ = 0;
};

class Field
{
public:
    /**
     * @brief Builds a field filled with one value (already in `unit`).
     */
    static Field constant(std::string name, Unit unit, double value, const GridShape& shape);

    /**
     * @brief Builds a constant field from a tagged quantity.
     *
     * The quantity is converted into `unit` before filling.
     *
     * @throws UnitIncompatible when the quantity cannot be expressed in `unit`.
     */
    static Field from_quantity(std::string name, Unit unit, const Quantity& value, const GridShape& shape);

    /**
     * @brief Builds a field from row-major values that exactly fill `shape`.
     * @throws ShapeMismatch when the value count differs from the shape size.
     */
    static Field from_values(std::string name, Unit unit, const std::vector<double>& values, const GridShape& shape);

    /**
     * @brief Broadcasts row-major `values` of `source` shape onto `target`.
     *
     * Axes are aligned from the right; each source extent must equal the
     * target extent or be 1. A `(n_lon, n_lat)` grid therefore repeats over
     * every layer of a volume target.
     *
     * @throws ShapeMismatch when the shapes are not broadcast-compatible.
     */
    static Field broadcast(std::string name,
                           Unit unit,
                           const std::vector<double>& values,
                           const std::vector<int>& source,
                           const GridShape& target);

    const std::string& name() const { return name_; }
    const Unit& unit() const { return unit_; }
    const GridShape& shape() const { return shape_; }

    std::size_t size() const { return data_.size(); }

    /**
     * @brief Row-major float32 view of the values.
     */
    const std::vector<float>& flat() const { return data_; }

    float at(int i, int j) const { return data_[flatten_index(i, j)]; }
    float at(int k, int i, int j) const { return data_[flatten_index(k, i, j)]; }

private:
    Field(std::string name, Unit unit, GridShape shape, std::vector<float> data);

    std::size_t flatten_index(int i, int j) const
    {
        assert(shape_.is_surface());
        assert(i >= 0 && i < shape_.extent(0) && j >= 0 && j < shape_.extent(1));
        return static_cast<std::size_t>(i) * static_cast<std::size_t>(shape_.extent(1)) +
               static_cast<std::size_t>(j);
    }

    std::size_t flatten_index(int k, int i, int j) const
    {
        assert(shape_.is_volume());
        assert(k >= 0 && k < shape_.extent(0) && i >= 0 && i < shape_.extent(1) &&
               j >= 0 && j < shape_.extent(2));
        // Row-major: idx = k*NLON*NLAT + i*NLAT + j.
        return static_cast<std::size_t>(k) * static_cast<std::size_t>(shape_.extent(1)) *
                   static_cast<std::size_t>(shape_.extent(2)) +
               static_cast<std::size_t>(i) * static_cast<std::size_t>(shape_.extent(2)) +
               static_cast<std::size_t>(j);
    }

    std::string name_;
    Unit unit_;
    GridShape shape_;
    std::vector<float> data_;
};

/**
 * @brief Appends a field's flat values to an output buffer.
 */
inline void append_flat(std::vector<float>& out, const Field& field)
{
    const std::vector<float>& values = field.flat();
    out.insert(out.end(), values.begin(), values.end());
}

} // namespace gcm
