/**
 * @file grid_field.cpp
 * @brief Grid shape checks and field factories.
 *
 * Provides overflow-safe extent math, constant fills, exact-size
 * construction, and trailing-axis broadcasting onto the GCM mesh.
 */

#include "grid_field.hpp"

#include "gcm_errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <utility>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace gcm
{
namespace
{

std::size_t checked_size(const std::vector<int>& dims)
{
    std::size_t total = 1;
    for (int extent : dims)
    {
        if (extent <= 0)
        {
            throw ShapeMismatch("grid extents must be positive, got " + std::to_string(extent));
        }
        const std::size_t extent_sz = static_cast<std::size_t>(extent);
        if (total > std::numeric_limits<std::size_t>::max() / extent_sz)
        {
            throw ShapeMismatch("grid size overflow");
        }
        total *= extent_sz;
    }
    return total;
}

std::string dims_to_string(const std::vector<int>& dims)
{
    std::ostringstream oss;
    oss << "(";
    for (std::size_t i = 0; i < dims.size(); ++i)
    {
        if (i > 0)
        {
            oss << ", ";
        }
        oss << dims[i];
    }
    oss << ")";
    return oss.str();
}

}

GridShape::GridShape(std::vector<int> dims) : dims_(std::move(dims))
{
    if (dims_.size() != 2 && dims_.size() != 3)
    {
        throw ShapeMismatch("grid shape must be 2-D (n_lon, n_lat) or 3-D (n_layer, n_lon, n_lat), got " +
                            dims_to_string(dims_));
    }
    count_ = checked_size(dims_);
}

GridShape GridShape::horizontal() const
{
    if (!is_volume())
    {
        throw ShapeMismatch("horizontal() requires a 3-D shape, got " + to_string());
    }
    return GridShape::surface(dims_[1], dims_[2]);
}

std::string GridShape::to_string() const
{
    return dims_to_string(dims_);
}

Field::Field(std::string name, Unit unit, GridShape shape, std::vector<float> data)
    : name_(std::move(name)), unit_(std::move(unit)), shape_(std::move(shape)), data_(std::move(data))
{
}

Field Field::constant(std::string name, Unit unit, double value, const GridShape& shape)
{
    std::vector<float> data(shape.element_count(), static_cast<float>(value));
    return Field(std::move(name), std::move(unit), shape, std::move(data));
}

Field Field::from_quantity(std::string name, Unit unit, const Quantity& value, const GridShape& shape)
{
    const double converted = value.to(unit);
    return constant(std::move(name), std::move(unit), converted, shape);
}

Field Field::from_values(std::string name, Unit unit, const std::vector<double>& values, const GridShape& shape)
{
    if (values.size() != shape.element_count())
    {
        throw ShapeMismatch("field '" + name + "' has " + std::to_string(values.size()) +
                            " values but shape " + shape.to_string() + " needs " +
                            std::to_string(shape.element_count()));
    }

    std::vector<float> data(values.size());
    const std::size_t count = values.size();
    #pragma omp parallel for
    for (long long idx = 0; idx < static_cast<long long>(count); ++idx)
    {
        data[static_cast<std::size_t>(idx)] = static_cast<float>(values[static_cast<std::size_t>(idx)]);
    }
    return Field(std::move(name), std::move(unit), shape, std::move(data));
}

Field Field::broadcast(std::string name,
                       Unit unit,
                       const std::vector<double>& values,
                       const std::vector<int>& source,
                       const GridShape& target)
{
    const std::vector<int>& dims = target.dims();
    const std::size_t source_count = source.empty() ? 1 : checked_size(source);
    if (values.size() != source_count)
    {
        throw ShapeMismatch("field '" + name + "' has " + std::to_string(values.size()) +
                            " values but source shape " + dims_to_string(source) + " needs " +
                            std::to_string(source_count));
    }
    if (source.size() > dims.size())
    {
        throw ShapeMismatch("cannot broadcast field '" + name + "' from " + dims_to_string(source) +
                            " to " + target.to_string());
    }

    // Source strides aligned to the target's trailing axes; broadcast axes get stride 0.
    const std::size_t offset = dims.size() - source.size();
    std::vector<std::size_t> source_strides(dims.size(), 0);
    std::size_t stride = 1;
    for (std::size_t a = source.size(); a-- > 0;)
    {
        const int s = source[a];
        const int t = dims[a + offset];
        if (s != t && s != 1)
        {
            throw ShapeMismatch("cannot broadcast field '" + name + "' from " + dims_to_string(source) +
                                " to " + target.to_string());
        }
        source_strides[a + offset] = (s == 1) ? 0 : stride;
        stride *= static_cast<std::size_t>(s);
    }

    const std::size_t count = target.element_count();
    std::vector<float> data(count);
    #pragma omp parallel for
    for (long long idx = 0; idx < static_cast<long long>(count); ++idx)
    {
        std::size_t remainder = static_cast<std::size_t>(idx);
        std::size_t source_index = 0;
        for (std::size_t a = dims.size(); a-- > 0;)
        {
            const std::size_t extent = static_cast<std::size_t>(dims[a]);
            source_index += (remainder % extent) * source_strides[a];
            remainder /= extent;
        }
        data[static_cast<std::size_t>(idx)] = static_cast<float>(values[source_index]);
    }
    return Field(std::move(name), std::move(unit), target, std::move(data));
}

} // namespace gcm
