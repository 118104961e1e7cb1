#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "collections.hpp"
#include "field_contract.hpp"
#include "grid_field.hpp"

/**
 * @file planet.hpp
 * @brief Planet GCM aggregate and its PSG header/binary encoding.
 *
 * A Planet owns every field of one atmosphere snapshot. Construction
 * validates the cross-field shape invariants; after that every accessor
 * is a pure function of the fields. The header variable list, the
 * parameter table and the binary payload all derive from one ordered
 * list of active variables so their orders cannot drift apart.
 */

namespace gcm
{

inline constexpr const char* default_atmosphere_description = "Variable Star Phase CurvE (VSPEC) default GCM";
inline constexpr const char* atmosphere_structure = "Equilibrium";
inline constexpr const char* binary_open_tag = "<BINARY>";
inline constexpr const char* binary_close_tag = "</BINARY>";
inline constexpr const char* winds_token = "Winds";

/**
 * @brief Optional-by-kind inputs to a Planet.
 *
 * Pressure and surface pressure are required; leaving either empty makes
 * the Planet constructor throw MissingRequiredField.
 */
struct PlanetComponents
{
    std::optional<Winds> wind;
    std::optional<Field> tsurf;
    std::optional<Field> psurf;
    std::optional<Field> albedo;
    std::optional<Field> emissivity;
    std::optional<Field> temperature;
    std::optional<Field> pressure;
    std::optional<Molecules> molecules;
    std::optional<Aerosols> aerosols;
    std::string description = default_atmosphere_description;
};

/**
 * @brief One entry of the GCM variable list.
 *
 * `fields` point into the owning Planet and are valid while it lives.
 * Winds contribute a single token backed by two fields.
 */
struct ActiveVariable
{
    std::string token;
    FieldKind kind = FieldKind::Pressure;
    std::vector<const Field*> fields;
};

/**
 * @brief Insertion-ordered header parameter table.
 */
using ParamTable = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Grid description parsed back out of a GCM-parameters string.
 */
struct GcmGridDescriptor
{
    int n_lon = 0;
    int n_lat = 0;
    int n_layer = 0;
    double lon_origin = 0.0;
    double lat_origin = 0.0;
    double dlon = 0.0;
    double dlat = 0.0;
    std::vector<std::string> variables;
};

class Planet
{
public:
    /**
     * @brief Takes ownership of the components and validates them.
     * @throws MissingRequiredField when pressure or psurf is absent.
     * @throws ShapeMismatch when any present field disagrees with the
     *         canonical 3-D or 2-D shape.
     */
    explicit Planet(PlanetComponents components);

    /**
     * @brief Re-checks the shape invariants; called by the constructor.
     */
    void validate() const;

    const std::optional<Winds>& wind() const { return parts_.wind; }
    const std::optional<Field>& tsurf() const { return parts_.tsurf; }
    const Field& psurf() const { return *parts_.psurf; }
    const std::optional<Field>& albedo() const { return parts_.albedo; }
    const std::optional<Field>& emissivity() const { return parts_.emissivity; }
    const std::optional<Field>& temperature() const { return parts_.temperature; }
    const Field& pressure() const { return *parts_.pressure; }
    const std::optional<Molecules>& molecules() const { return parts_.molecules; }
    const std::optional<Aerosols>& aerosols() const { return parts_.aerosols; }
    const std::string& description() const { return parts_.description; }

    /**
     * @brief Returns `(n_layer, n_lon, n_lat)` from the pressure field.
     */
    const GridShape& shape() const { return pressure().shape(); }

    int n_layer() const { return shape().extent(0); }
    int n_lon() const { return shape().extent(1); }
    int n_lat() const { return shape().extent(2); }

    std::vector<double> lons() const;
    std::vector<double> lats() const;
    double dlon() const;
    double dlat() const;

    /**
     * @brief Ordered list of present variables, in payload order.
     */
    std::vector<ActiveVariable> active_variables() const;

    /**
     * @brief Grid coordinates followed by the ordered variable tokens.
     */
    std::string gcm_properties() const;

    /**
     * @brief Header parameters in emission order.
     * @throws UnknownSpecies for a gas or aerosol missing from the tables.
     */
    ParamTable psg_params() const;

    /**
     * @brief Row-major float32 payload of every active variable.
     */
    std::vector<float> flat() const;

    /**
     * @brief `<KEY>value` lines, each terminated by a newline.
     */
    std::string header_text() const;

    /**
     * @brief Complete wire artifact: header, `<BINARY>`, payload, `</BINARY>`.
     */
    std::vector<std::uint8_t> content() const;

private:
    PlanetComponents parts_;
};

/**
 * @brief Parses a GCM-parameters string produced by Planet::gcm_properties.
 * @throws std::invalid_argument when the string is malformed.
 */
GcmGridDescriptor parse_gcm_properties(const std::string& text);

} // namespace gcm
