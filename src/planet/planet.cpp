/**
 * @file planet.cpp
 * @brief Planet validation, coordinate derivation, and PSG encoding.
 *
 * Every view of the planet (GCM variable list, parameter table, binary
 * payload) walks the same active-variable list built here.
 */

#include "planet.hpp"

#include "gcm_errors.hpp"
#include "grid_axes.hpp"
#include "species.hpp"
#include "string_utils.hpp"

#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace gcm
{
namespace
{

void require_shape(const Field& field, const GridShape& expected, const char* role)
{
    if (field.shape() != expected)
    {
        throw ShapeMismatch(std::string(role) + " field '" + field.name() + "' has shape " +
                            field.shape().to_string() + " but the planet grid requires " +
                            expected.to_string());
    }
}

void push_variable(std::vector<ActiveVariable>& out, const Field& field, FieldKind kind)
{
    ActiveVariable variable;
    variable.token = field.name();
    variable.kind = kind;
    variable.fields.push_back(&field);
    out.push_back(std::move(variable));
}

int parse_descriptor_int(const std::string& text, const char* what)
{
    try
    {
        std::size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed == text.size())
        {
            return value;
        }
    }
    catch (const std::exception&)
    {
    }
    throw std::invalid_argument(std::string("GCM parameters: malformed ") + what + " '" + text + "'");
}

double parse_descriptor_double(const std::string& text, const char* what)
{
    try
    {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed == text.size())
        {
            return value;
        }
    }
    catch (const std::exception&)
    {
    }
    throw std::invalid_argument(std::string("GCM parameters: malformed ") + what + " '" + text + "'");
}

std::string repeated_list(const std::string& value, std::size_t count)
{
    return strutil::join(std::vector<std::string>(count, value));
}

}

Planet::Planet(PlanetComponents components) : parts_(std::move(components))
{
    validate();
}

void Planet::validate() const
{
    if (!parts_.pressure)
    {
        throw MissingRequiredField("pressure");
    }
    if (!parts_.psurf)
    {
        throw MissingRequiredField("psurf");
    }

    const GridShape& shape3d = parts_.pressure->shape();
    if (!shape3d.is_volume())
    {
        throw ShapeMismatch("pressure field '" + parts_.pressure->name() +
                            "' must be 3-D (n_layer, n_lon, n_lat), got " + shape3d.to_string());
    }
    const GridShape shape2d = shape3d.horizontal();

    require_shape(*parts_.psurf, shape2d, "psurf");
    if (parts_.wind)
    {
        require_shape(parts_.wind->wind_u(), shape3d, "wind_u");
        require_shape(parts_.wind->wind_v(), shape3d, "wind_v");
    }
    if (parts_.tsurf)
    {
        require_shape(*parts_.tsurf, shape2d, "tsurf");
    }
    if (parts_.albedo)
    {
        require_shape(*parts_.albedo, shape2d, "albedo");
    }
    if (parts_.emissivity)
    {
        require_shape(*parts_.emissivity, shape2d, "emissivity");
    }
    if (parts_.temperature)
    {
        require_shape(*parts_.temperature, shape3d, "temperature");
    }
    if (parts_.molecules)
    {
        for (const Field& molecule : parts_.molecules->molecules())
        {
            require_shape(molecule, shape3d, "molecule");
        }
    }
    if (parts_.aerosols)
    {
        for (const Field& aerosol : parts_.aerosols->aerosols())
        {
            require_shape(aerosol, shape3d, "aerosol");
        }
        for (const Field& size : parts_.aerosols->sizes())
        {
            require_shape(size, shape3d, "aerosol size");
        }
    }
}

std::vector<double> Planet::lons() const
{
    return grid_axes::longitudes_deg(n_lon());
}

std::vector<double> Planet::lats() const
{
    return grid_axes::latitudes_deg(n_lat());
}

double Planet::dlon() const
{
    return grid_axes::longitude_spacing_deg(n_lon());
}

double Planet::dlat() const
{
    return grid_axes::latitude_spacing_deg(n_lat());
}

std::vector<ActiveVariable> Planet::active_variables() const
{
    std::vector<ActiveVariable> out;

    if (parts_.wind)
    {
        ActiveVariable winds;
        winds.token = winds_token;
        winds.kind = FieldKind::WindU;
        winds.fields = {&parts_.wind->wind_u(), &parts_.wind->wind_v()};
        out.push_back(std::move(winds));
    }
    if (parts_.tsurf)
    {
        push_variable(out, *parts_.tsurf, FieldKind::SurfaceTemperature);
    }
    push_variable(out, *parts_.psurf, FieldKind::SurfacePressure);
    if (parts_.albedo)
    {
        push_variable(out, *parts_.albedo, FieldKind::Albedo);
    }
    if (parts_.emissivity)
    {
        push_variable(out, *parts_.emissivity, FieldKind::Emissivity);
    }
    if (parts_.temperature)
    {
        push_variable(out, *parts_.temperature, FieldKind::Temperature);
    }
    push_variable(out, *parts_.pressure, FieldKind::Pressure);
    if (parts_.molecules)
    {
        for (const Field& molecule : parts_.molecules->molecules())
        {
            push_variable(out, molecule, FieldKind::Molecule);
        }
    }
    if (parts_.aerosols)
    {
        for (const Field& aerosol : parts_.aerosols->aerosols())
        {
            push_variable(out, aerosol, FieldKind::Aerosol);
        }
        for (const Field& size : parts_.aerosols->sizes())
        {
            push_variable(out, size, FieldKind::AerosolSize);
        }
    }
    return out;
}

std::string Planet::gcm_properties() const
{
    std::ostringstream oss;
    oss << n_lon() << ',' << n_lat() << ',' << n_layer() << ','
        << std::fixed << std::setprecision(1) << grid_axes::lon_origin_deg << ','
        << grid_axes::lat_origin_deg << ','
        << std::setprecision(2) << dlon() << ',' << dlat();
    for (const ActiveVariable& variable : active_variables())
    {
        oss << ',' << variable.token;
    }
    return oss.str();
}

ParamTable Planet::psg_params() const
{
    std::vector<std::string> gases;
    std::vector<std::string> gas_types;
    std::vector<std::string> aerosols;
    std::vector<std::string> aerosol_types;
    for (const ActiveVariable& variable : active_variables())
    {
        if (variable.kind == FieldKind::Molecule)
        {
            gases.push_back(variable.token);
            gas_types.push_back(gas_type_token(parse_gas_species(variable.token)));
        }
        else if (variable.kind == FieldKind::Aerosol)
        {
            aerosols.push_back(variable.token);
            aerosol_types.push_back(aerosol_type_token(parse_aerosol_species(variable.token)));
        }
    }

    ParamTable params = {
        {"ATMOSPHERE-DESCRIPTION", parts_.description},
        {"ATMOSPHERE-STRUCTURE", atmosphere_structure},
        {"ATMOSPHERE-LAYERS", std::to_string(n_layer())},
        {"ATMOSPHERE-NGAS", std::to_string(gases.size())},
        {"ATMOSPHERE-GAS", strutil::join(gases)},
        {"ATMOSPHERE-TYPE", strutil::join(gas_types)},
        {"ATMOSPHERE-ABUN", repeated_list("1", gases.size())},
        {"ATMOSPHERE-UNIT", repeated_list("scl", gases.size())},
        {"ATMOSPHERE-GCM-PARAMETERS", gcm_properties()},
    };

    if (!aerosols.empty())
    {
        params.emplace_back("ATMOSPHERE-NAERO", std::to_string(aerosols.size()));
        params.emplace_back("ATMOSPHERE-AEROS", strutil::join(aerosols));
        params.emplace_back("ATMOSPHERE-ATYPE", strutil::join(aerosol_types));
        params.emplace_back("ATMOSPHERE-AABUN", repeated_list("1", aerosols.size()));
        params.emplace_back("ATMOSPHERE-AUNIT", repeated_list("scl", aerosols.size()));
        params.emplace_back("ATMOSPHERE-ASIZE", repeated_list("1", aerosols.size()));
        params.emplace_back("ATMOSPHERE-ASUNI", repeated_list("scl", aerosols.size()));
    }
    return params;
}

std::vector<float> Planet::flat() const
{
    const std::vector<ActiveVariable> variables = active_variables();

    std::size_t total = 0;
    for (const ActiveVariable& variable : variables)
    {
        for (const Field* field : variable.fields)
        {
            total += field->size();
        }
    }

    std::vector<float> out;
    out.reserve(total);
    for (const ActiveVariable& variable : variables)
    {
        for (const Field* field : variable.fields)
        {
            append_flat(out, *field);
        }
    }
    return out;
}

std::string Planet::header_text() const
{
    std::ostringstream oss;
    for (const auto& param : psg_params())
    {
        oss << '<' << param.first << '>' << param.second << '\n';
    }
    return oss.str();
}

std::vector<std::uint8_t> Planet::content() const
{
    const std::string header = header_text();
    const std::vector<float> payload = flat();
    const std::size_t open_len = std::strlen(binary_open_tag);
    const std::size_t close_len = std::strlen(binary_close_tag);
    const std::size_t payload_bytes = payload.size() * sizeof(float);

    std::vector<std::uint8_t> out(header.size() + open_len + payload_bytes + close_len);
    std::uint8_t* cursor = out.data();
    std::memcpy(cursor, header.data(), header.size());
    cursor += header.size();
    std::memcpy(cursor, binary_open_tag, open_len);
    cursor += open_len;
    if (payload_bytes > 0)
    {
        std::memcpy(cursor, payload.data(), payload_bytes);
    }
    cursor += payload_bytes;
    std::memcpy(cursor, binary_close_tag, close_len);
    return out;
}

GcmGridDescriptor parse_gcm_properties(const std::string& text)
{
    const std::vector<std::string> parts = strutil::split(text, ',');
    if (parts.size() < 7)
    {
        throw std::invalid_argument("GCM parameters: expected at least 7 comma-separated entries, got " +
                                    std::to_string(parts.size()));
    }

    GcmGridDescriptor out;
    out.n_lon = parse_descriptor_int(parts[0], "n_lon");
    out.n_lat = parse_descriptor_int(parts[1], "n_lat");
    out.n_layer = parse_descriptor_int(parts[2], "n_layer");
    out.lon_origin = parse_descriptor_double(parts[3], "longitude origin");
    out.lat_origin = parse_descriptor_double(parts[4], "latitude origin");
    out.dlon = parse_descriptor_double(parts[5], "dlon");
    out.dlat = parse_descriptor_double(parts[6], "dlat");
    for (std::size_t i = 7; i < parts.size(); ++i)
    {
        if (parts[i].empty())
        {
            throw std::invalid_argument("GCM parameters: empty variable name at position " + std::to_string(i));
        }
        out.variables.push_back(parts[i]);
    }
    return out;
}

} // namespace gcm
