/**
 * @file collections.cpp
 * @brief Winds, Molecules and Aerosols collections.
 *
 * Builds the ordered volume-field collections from name-keyed mappings
 * and concatenates their payloads in collection order.
 */

#include "collections.hpp"

#include "field_contract.hpp"

#include <stdexcept>
#include <unordered_set>

namespace gcm
{
namespace
{

std::size_t total_size(const std::vector<Field>& fields)
{
    std::size_t total = 0;
    for (const Field& field : fields)
    {
        total += field.size();
    }
    return total;
}

void require_unique_names(const std::vector<Field>& fields, const char* collection)
{
    std::unordered_set<std::string> seen;
    for (const Field& field : fields)
    {
        if (!seen.insert(field.name()).second)
        {
            throw std::invalid_argument(std::string(collection) + " contains duplicate name '" +
                                        field.name() + "'");
        }
    }
}

}

Winds Winds::constant(const Quantity& u, const Quantity& v, const GridShape& shape)
{
    const FieldContract& u_contract = contract_for(FieldKind::WindU);
    const FieldContract& v_contract = contract_for(FieldKind::WindV);
    return Winds(Field::from_quantity(u_contract.default_name, declared_unit(FieldKind::WindU), u, shape),
                 Field::from_quantity(v_contract.default_name, declared_unit(FieldKind::WindV), v, shape));
}

std::vector<float> Winds::flat() const
{
    std::vector<float> out;
    out.reserve(wind_u_.size() + wind_v_.size());
    append_flat(out, wind_u_);
    append_flat(out, wind_v_);
    return out;
}

Molecules::Molecules(std::vector<Field> molecules) : molecules_(std::move(molecules))
{
    require_unique_names(molecules_, "molecules");
}

Molecules Molecules::from_mapping(const AbundanceMapping& abundances, const GridShape& shape)
{
    const Unit unit = declared_unit(FieldKind::Molecule);
    std::vector<Field> molecules;
    molecules.reserve(abundances.size());
    for (const auto& entry : abundances)
    {
        molecules.push_back(Field::from_quantity(entry.first, unit, entry.second, shape));
    }
    return Molecules(std::move(molecules));
}

std::vector<std::string> Molecules::names() const
{
    std::vector<std::string> out;
    out.reserve(molecules_.size());
    for (const Field& molecule : molecules_)
    {
        out.push_back(molecule.name());
    }
    return out;
}

std::vector<float> Molecules::flat() const
{
    std::vector<float> out;
    out.reserve(total_size(molecules_));
    for (const Field& molecule : molecules_)
    {
        append_flat(out, molecule);
    }
    return out;
}

Aerosols::Aerosols(std::vector<Field> aerosols, std::vector<Field> sizes)
    : aerosols_(std::move(aerosols)), sizes_(std::move(sizes))
{
    if (aerosols_.size() != sizes_.size())
    {
        throw std::invalid_argument("aerosols has " + std::to_string(aerosols_.size()) +
                                    " abundance fields but " + std::to_string(sizes_.size()) +
                                    " size fields");
    }
    for (std::size_t i = 0; i < aerosols_.size(); ++i)
    {
        const std::string expected = aerosols_[i].name() + aerosol_size_suffix;
        if (sizes_[i].name() != expected)
        {
            throw std::invalid_argument("aerosol size field '" + sizes_[i].name() +
                                        "' does not match abundance field '" + aerosols_[i].name() +
                                        "' (expected '" + expected + "')");
        }
    }
    require_unique_names(aerosols_, "aerosols");
}

Aerosols Aerosols::from_mapping(const std::vector<AerosolEntry>& entries, const GridShape& shape)
{
    const Unit abundance_unit = declared_unit(FieldKind::Aerosol);
    const Unit size_unit = declared_unit(FieldKind::AerosolSize);

    std::vector<Field> aerosols;
    std::vector<Field> sizes;
    aerosols.reserve(entries.size());
    sizes.reserve(entries.size());
    for (const AerosolEntry& entry : entries)
    {
        aerosols.push_back(Field::from_quantity(entry.name, abundance_unit, entry.abundance, shape));
        sizes.push_back(Field::from_quantity(entry.name + aerosol_size_suffix, size_unit, entry.size, shape));
    }
    return Aerosols(std::move(aerosols), std::move(sizes));
}

std::vector<std::string> Aerosols::names() const
{
    std::vector<std::string> out;
    out.reserve(aerosols_.size());
    for (const Field& aerosol : aerosols_)
    {
        out.push_back(aerosol.name());
    }
    return out;
}

std::vector<float> Aerosols::flat() const
{
    std::vector<float> out;
    out.reserve(total_size(aerosols_) + total_size(sizes_));
    for (const Field& aerosol : aerosols_)
    {
        append_flat(out, aerosol);
    }
    for (const Field& size : sizes_)
    {
        append_flat(out, size);
    }
    return out;
}

} // namespace gcm
