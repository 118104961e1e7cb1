#include "collections.hpp"
#include "gcm_errors.hpp"
#include "grid_field.hpp"
#include "logging.hpp"
#include "planet.hpp"
#include "planet_builder.hpp"
#include "species.hpp"
#include "units.hpp"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace
{

bool nearly_equal(double a, double b, double tol)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[planet-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[planet-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

template <typename Exception, typename Fn>
int expect_throws(Fn&& fn, const std::string& message)
{
    try
    {
        fn();
    }
    catch (const Exception&)
    {
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[planet-regression] FAIL: " << message << " (unexpected exception: " << e.what() << ")"
                  << std::endl;
        return 1;
    }
    std::cerr << "[planet-regression] FAIL: " << message << " (no exception)" << std::endl;
    return 1;
}

std::string find_param(const gcm::ParamTable& params, const std::string& key)
{
    for (const auto& param : params)
    {
        if (param.first == key)
        {
            return param.second;
        }
    }
    return "<missing>";
}

bool has_param(const gcm::ParamTable& params, const std::string& key)
{
    return find_param(params, key) != "<missing>";
}

/**
 * @brief Minimal planet: pressure, surface pressure and optional molecules.
 */
gcm::PlanetComponents base_components(int n_layer, int n_lon, int n_lat)
{
    const gcm::GridShape shape3d = gcm::GridShape::volume(n_layer, n_lon, n_lat);
    gcm::PlanetComponents parts;
    parts.pressure = gcm::Field::constant("Pressure", gcm::parse_unit("bar"), 1.0, shape3d);
    parts.psurf = gcm::Field::constant("Psurf", gcm::parse_unit("bar"), 1.0, shape3d.horizontal());
    return parts;
}

std::size_t payload_bytes_in(const gcm::Planet& planet)
{
    return planet.content().size() - planet.header_text().size() - std::strlen(gcm::binary_open_tag) -
           std::strlen(gcm::binary_close_tag);
}

int test_single_gas_scenario()
{
    int failures = 0;
    gcm::PlanetComponents parts = base_components(2, 2, 2);
    parts.molecules = gcm::Molecules::from_mapping({{"H2O", gcm::parse_quantity("1e-3")}},
                                                   gcm::GridShape::volume(2, 2, 2));
    const gcm::Planet planet(std::move(parts));

    const std::vector<float> flat = planet.flat();
    failures += expect_true(flat.size() == 20, "psurf(4) + pressure(8) + H2O(8) must be 20 elements, got " +
                                                   std::to_string(flat.size()));
    failures += expect_true(flat.size() * sizeof(float) == payload_bytes_in(planet),
                            "payload bytes must equal 4 * len(flat)");

    const gcm::ParamTable params = planet.psg_params();
    failures += expect_true(find_param(params, "ATMOSPHERE-NGAS") == "1", "NGAS must be 1");
    failures += expect_true(find_param(params, "ATMOSPHERE-GAS") == "H2O", "GAS must be H2O");
    failures += expect_true(find_param(params, "ATMOSPHERE-TYPE") == "HIT[1]", "H2O type must be HIT[1]");
    failures += expect_true(find_param(params, "ATMOSPHERE-ABUN") == "1", "ABUN scales to 1");
    failures += expect_true(find_param(params, "ATMOSPHERE-UNIT") == "scl", "UNIT is scl");
    failures += expect_true(find_param(params, "ATMOSPHERE-LAYERS") == "2", "LAYERS must be 2");
    failures += expect_true(find_param(params, "ATMOSPHERE-DESCRIPTION") ==
                                "Variable Star Phase CurvE (VSPEC) default GCM",
                            "default description must match the PSG default GCM text");
    failures += expect_true(!has_param(params, "ATMOSPHERE-NAERO"), "no aerosol keys without aerosols");
    failures += expect_true(planet.gcm_properties() == "2,2,2,-180.0,-90.0,180.00,90.00,Psurf,Pressure,H2O",
                            "gcm_properties mismatch: " + planet.gcm_properties());
    return failures;
}

int test_header_and_binary_layout()
{
    int failures = 0;
    gcm::PlanetComponents parts = base_components(2, 2, 2);
    parts.psurf = gcm::Field::constant("Psurf", gcm::parse_unit("bar"), 0.75, gcm::GridShape::surface(2, 2));
    parts.description = "Layout check";
    const gcm::Planet planet(std::move(parts));

    const std::string header = planet.header_text();
    failures += expect_true(header.rfind("<ATMOSPHERE-DESCRIPTION>Layout check\n", 0) == 0,
                            "header must open with the description line");
    failures += expect_true(header.find("<ATMOSPHERE-STRUCTURE>Equilibrium\n") != std::string::npos,
                            "header must declare the Equilibrium structure");
    failures += expect_true(header.find("<ATMOSPHERE-NGAS>0\n") != std::string::npos,
                            "absent molecules must give NGAS 0");
    failures += expect_true(header.back() == '\n', "every header line ends with a newline");

    const std::vector<std::uint8_t> bytes = planet.content();
    const std::size_t open_at = header.size();
    failures += expect_true(std::memcmp(bytes.data() + open_at, "<BINARY>", 8) == 0,
                            "<BINARY> must follow the header");
    failures += expect_true(std::memcmp(bytes.data() + bytes.size() - 9, "</BINARY>", 9) == 0,
                            "</BINARY> must close the artifact");

    float first = 0.0f;
    std::memcpy(&first, bytes.data() + open_at + 8, sizeof(float));
    failures += expect_close(first, 0.75, "first payload float is Psurf", 1.0e-7);
    failures += expect_true(payload_bytes_in(planet) == 12 * sizeof(float), "psurf + pressure payload size");
    return failures;
}

int test_two_aerosol_scenario()
{
    int failures = 0;
    const gcm::GridShape shape = gcm::GridShape::volume(2, 2, 2);
    gcm::PlanetComponents parts = base_components(2, 2, 2);
    parts.aerosols = gcm::Aerosols::from_mapping(
        {
            {"WaterIce", gcm::parse_quantity("2e-5"), gcm::parse_quantity("20 um")},
            {"Water", gcm::parse_quantity("1e-4"), gcm::parse_quantity("10 um")},
        },
        shape);
    const gcm::Planet planet(std::move(parts));

    failures += expect_true(planet.aerosols()->flat().size() == 2 * 8 * 2, "Aerosols.flat must hold 32 elements");

    const gcm::ParamTable params = planet.psg_params();
    failures += expect_true(find_param(params, "ATMOSPHERE-NAERO") == "2", "NAERO must be 2");
    failures += expect_true(find_param(params, "ATMOSPHERE-AEROS") == "WaterIce,Water", "AEROS keeps order");
    failures += expect_true(find_param(params, "ATMOSPHERE-ATYPE") == "Warren_ICE_IRI,AFCRL_WATER_HRI",
                            "ATYPE follows AEROS");
    failures += expect_true(find_param(params, "ATMOSPHERE-ASIZE") == "1,1", "ASIZE scales to 1");
    failures += expect_true(find_param(params, "ATMOSPHERE-ASUNI") == "scl,scl", "ASUNI is scl");

    // Psurf(4) + Pressure(8) precede the aerosol blocks.
    const std::vector<float> flat = planet.flat();
    failures += expect_true(flat.size() == 4 + 8 + 32, "planet payload with two aerosols");
    failures += expect_close(flat[12], 2.0e-5, "first aerosol block is WaterIce", 1.0e-11);
    failures += expect_close(flat[20], 1.0e-4, "second aerosol block is Water", 1.0e-10);
    failures += expect_close(flat[28], 2.0e-5, "first size block is WaterIce_size", 1.0e-11);
    failures += expect_true(planet.gcm_properties() ==
                                "2,2,2,-180.0,-90.0,180.00,90.00,Psurf,Pressure,WaterIce,Water,"
                                "WaterIce_size,Water_size",
                            "gcm_properties aerosol order: " + planet.gcm_properties());
    return failures;
}

int test_full_planet_order_agreement()
{
    int failures = 0;
    const gcm::GridShape shape3d = gcm::GridShape::volume(3, 4, 3);
    const gcm::GridShape shape2d = shape3d.horizontal();
    gcm::PlanetComponents parts = base_components(3, 4, 3);
    parts.wind = gcm::Winds::constant(gcm::parse_quantity("5 m/s"), gcm::parse_quantity("1 m/s"), shape3d);
    parts.tsurf = gcm::Field::constant("Tsurf", gcm::parse_unit("K"), 280.0, shape2d);
    parts.albedo = gcm::Field::constant("Albedo", gcm::Unit::dimensionless(), 0.3, shape2d);
    parts.emissivity = gcm::Field::constant("Emissivity", gcm::Unit::dimensionless(), 0.9, shape2d);
    parts.temperature = gcm::Field::constant("Temperature", gcm::parse_unit("K"), 250.0, shape3d);
    parts.molecules = gcm::Molecules::from_mapping(
        {{"CO2", gcm::parse_quantity("0.96")}, {"N2", gcm::parse_quantity("0.04")}}, shape3d);
    parts.aerosols = gcm::Aerosols::from_mapping(
        {{"Water", gcm::parse_quantity("1e-4"), gcm::parse_quantity("1 um")}}, shape3d);
    const gcm::Planet planet(std::move(parts));

    const std::vector<gcm::ActiveVariable> variables = planet.active_variables();
    const gcm::GcmGridDescriptor descriptor = gcm::parse_gcm_properties(planet.gcm_properties());

    std::vector<std::string> tokens;
    std::size_t field_elements = 0;
    for (const auto& variable : variables)
    {
        tokens.push_back(variable.token);
        for (const gcm::Field* field : variable.fields)
        {
            field_elements += field->size();
        }
    }
    const std::vector<std::string> expected = {
        "Winds", "Tsurf", "Psurf", "Albedo", "Emissivity", "Temperature", "Pressure", "CO2", "N2", "Water",
        "Water_size",
    };
    failures += expect_true(tokens == expected, "active variable order must follow the canonical order");
    failures += expect_true(descriptor.variables == tokens, "descriptor variables must match the payload order");
    failures += expect_true(field_elements == planet.flat().size(), "active fields must account for the payload");
    failures += expect_true(planet.flat().size() * sizeof(float) == payload_bytes_in(planet),
                            "payload bytes must equal 4 * len(flat)");

    const std::vector<float> flat = planet.flat();
    failures += expect_close(flat[0], 5.0, "U opens the payload", 1.0e-6);
    failures += expect_close(flat[36], 1.0, "V follows U", 1.0e-6);
    failures += expect_close(flat[72], 280.0, "Tsurf follows the winds", 1.0e-4);
    failures += expect_true(find_param(planet.psg_params(), "ATMOSPHERE-TYPE") == "HIT[2],HIT[22]",
                            "CO2 and N2 HITRAN types");
    return failures;
}

int test_descriptor_round_trip()
{
    int failures = 0;
    const gcm::Planet planet(base_components(5, 8, 6));
    const gcm::GcmGridDescriptor descriptor = gcm::parse_gcm_properties(planet.gcm_properties());
    failures += expect_true(descriptor.n_layer == planet.n_layer() && descriptor.n_lon == planet.n_lon() &&
                                descriptor.n_lat == planet.n_lat(),
                            "descriptor must reproduce (n_layer, n_lon, n_lat)");
    failures += expect_true(descriptor.n_layer == 5 && descriptor.n_lon == 8 && descriptor.n_lat == 6,
                            "descriptor extents must be (5, 8, 6)");
    failures += expect_close(descriptor.lon_origin, -180.0, "lon origin");
    failures += expect_close(descriptor.lat_origin, -90.0, "lat origin");
    failures += expect_close(descriptor.dlon, 45.0, "dlon");
    failures += expect_close(descriptor.dlat, 30.0, "dlat");

    failures += expect_throws<std::invalid_argument>([] { gcm::parse_gcm_properties("2,2"); },
                                                     "short descriptor must be rejected");
    failures += expect_throws<std::invalid_argument>(
        [] { gcm::parse_gcm_properties("x,2,2,-180.0,-90.0,180.00,90.00,Psurf"); },
        "non-numeric extent must be rejected");
    failures += expect_throws<std::invalid_argument>(
        [] { gcm::parse_gcm_properties("2,2,2,-180.0,-90.0,180.00,90.00,,Pressure"); },
        "empty variable name must be rejected");
    return failures;
}

int test_axes()
{
    int failures = 0;
    const gcm::Planet planet(base_components(1, 4, 3));
    const std::vector<double> lons = planet.lons();
    const std::vector<double> lats = planet.lats();
    failures += expect_true(lons.size() == 4, "lons must have n_lon points");
    failures += expect_true(lats.size() == 3, "lats must have n_lat points");
    failures += expect_close(lons.front(), -180.0, "lons start at -180");
    failures += expect_true(lons.back() < 180.0, "lons stay below 180");
    failures += expect_close(lons[2], 0.0, "lons pass through 0");
    failures += expect_close(lats.front(), -90.0, "lats start at -90");
    failures += expect_close(lats.back(), 90.0, "lats end at 90");
    failures += expect_close(planet.dlon() * planet.n_lon(), 360.0, "dlon * n_lon == 360");
    failures += expect_close(planet.dlat() * planet.n_lat(), 180.0, "dlat * n_lat == 180");

    const gcm::Planet single(base_components(1, 1, 1));
    failures += expect_true(single.lats().size() == 1 && single.lats()[0] == -90.0,
                            "single latitude sits at the south pole");
    return failures;
}

int test_construction_errors()
{
    int failures = 0;
    failures += expect_throws<gcm::MissingRequiredField>(
        [] {
            gcm::PlanetComponents parts = base_components(2, 2, 2);
            parts.pressure.reset();
            gcm::Planet planet(std::move(parts));
        },
        "missing pressure must raise MissingRequiredField");

    try
    {
        gcm::PlanetComponents parts = base_components(2, 2, 2);
        parts.psurf.reset();
        gcm::Planet planet(std::move(parts));
        failures += expect_true(false, "missing psurf must raise");
    }
    catch (const gcm::MissingRequiredField& e)
    {
        failures += expect_true(e.field() == "psurf", "missing field must be reported as psurf");
    }

    failures += expect_throws<gcm::ShapeMismatch>(
        [] {
            gcm::PlanetComponents parts = base_components(2, 2, 2);
            parts.wind = gcm::Winds::constant(gcm::parse_quantity("1 m/s"), gcm::parse_quantity("1 m/s"),
                                              gcm::GridShape::volume(3, 2, 2));
            gcm::Planet planet(std::move(parts));
        },
        "mismatched wind shape must raise ShapeMismatch");
    failures += expect_throws<gcm::ShapeMismatch>(
        [] {
            gcm::PlanetComponents parts = base_components(2, 2, 2);
            parts.tsurf = gcm::Field::constant("Tsurf", gcm::parse_unit("K"), 280.0, gcm::GridShape::volume(2, 2, 2));
            gcm::Planet planet(std::move(parts));
        },
        "3-D tsurf must raise ShapeMismatch");
    failures += expect_throws<gcm::ShapeMismatch>(
        [] {
            gcm::PlanetComponents parts = base_components(2, 2, 2);
            parts.psurf = gcm::Field::constant("Psurf", gcm::parse_unit("bar"), 1.0, gcm::GridShape::surface(2, 3));
            gcm::Planet planet(std::move(parts));
        },
        "psurf must match the horizontal pressure shape");
    failures += expect_throws<gcm::ShapeMismatch>(
        [] {
            gcm::PlanetComponents parts = base_components(2, 2, 2);
            parts.pressure = gcm::Field::constant("Pressure", gcm::parse_unit("bar"), 1.0, gcm::GridShape::surface(2, 2));
            gcm::Planet planet(std::move(parts));
        },
        "2-D pressure must raise ShapeMismatch");
    return failures;
}

int test_unknown_species_in_header()
{
    int failures = 0;
    gcm::PlanetComponents parts = base_components(1, 2, 2);
    parts.molecules = gcm::Molecules::from_mapping({{"Xe", gcm::parse_quantity("1e-6")}},
                                                   gcm::GridShape::volume(1, 2, 2));
    const gcm::Planet planet(std::move(parts));
    failures += expect_throws<gcm::UnknownSpecies>([&] { planet.psg_params(); },
                                                   "unknown gas must raise UnknownSpecies in psg_params");
    failures += expect_throws<gcm::UnknownSpecies>([&] { planet.content(); },
                                                   "unknown gas must raise UnknownSpecies in content");
    return failures;
}

int test_gas_table_covers_hitran_molecules()
{
    int failures = 0;
    failures += expect_true(gcm::gas_type_token(gcm::parse_gas_species("HCl")) == "HIT[15]", "HCl is HIT[15]");
    failures += expect_true(gcm::gas_type_token(gcm::parse_gas_species("OCS")) == "HIT[19]", "OCS is HIT[19]");
    failures += expect_true(gcm::gas_type_token(gcm::parse_gas_species("HCN")) == "HIT[23]", "HCN is HIT[23]");
    failures += expect_true(gcm::gas_type_token(gcm::parse_gas_species("SO3")) == "HIT[47]", "SO3 is HIT[47]");

    std::set<int> hitran_ids;
    std::size_t hitran_count = 0;
    for (gcm::GasSpecies species : gcm::all_gas_species())
    {
        const std::string name = gcm::to_string(species);
        failures += expect_true(gcm::parse_gas_species(name) == species, "gas name must resolve back: " + name);
        const gcm::GasType type = gcm::gas_type(species);
        if (type.hitran && type.hitran_id > 0)
        {
            ++hitran_count;
            hitran_ids.insert(type.hitran_id);
        }
    }
    failures += expect_true(hitran_ids.size() == hitran_count, "HITRAN ids must be unique across gases");

    gcm::PlanetComponents parts = base_components(1, 2, 2);
    parts.molecules = gcm::Molecules::from_mapping(
        {{"CO2", gcm::parse_quantity("0.95")}, {"OCS", gcm::parse_quantity("1e-6")}, {"HCl", gcm::parse_quantity("1e-7")}},
        gcm::GridShape::volume(1, 2, 2));
    const gcm::Planet planet(std::move(parts));
    failures += expect_true(find_param(planet.psg_params(), "ATMOSPHERE-TYPE") == "HIT[2],HIT[19],HIT[15]",
                            "trace gas tokens follow mapping order");
    return failures;
}

gcm::PlanetConfig irradiated_config()
{
    gcm::PlanetConfig config;
    config.grid.n_layer = 12;
    config.grid.n_lon = 36;
    config.grid.n_lat = 19;
    config.planet.teff_star = gcm::parse_quantity("5800 K");
    config.planet.r_star = gcm::parse_quantity("1 R_sun");
    config.planet.r_orbit = gcm::parse_quantity("0.1 AU");
    config.planet.albedo = 0.2;
    config.planet.emissivity = 0.9;
    config.planet.epsilon = 0.7;
    config.planet.gamma = 1.3;
    config.planet.psurf = gcm::parse_quantity("10 bar");
    config.planet.ptop = gcm::parse_quantity("1e-6 bar");
    config.planet.wind_u = gcm::parse_quantity("25 m/s");
    config.planet.wind_v = gcm::parse_quantity("-5 m/s");
    config.molecules = {{"H2O", gcm::parse_quantity("1e-3")}, {"CO2", gcm::parse_quantity("0.96")}};
    config.aerosols = {{"Water", gcm::parse_quantity("1e-5 kg/kg"), gcm::parse_quantity("5 um")}};
    return config;
}

int test_content_is_deterministic()
{
    int failures = 0;
    const gcm::PlanetConfig config = irradiated_config();
    const std::vector<std::uint8_t> first = gcm::build_planet(config).content();
    const std::vector<std::uint8_t> second = gcm::build_planet(config).content();
    failures += expect_true(!first.empty(), "content must not be empty");
    failures += expect_true(first == second, "two builds of one config must encode identical bytes");

#ifdef _OPENMP
    const int threads = omp_get_max_threads();
    omp_set_num_threads(1);
    const std::vector<std::uint8_t> serial = gcm::build_planet(config).content();
    omp_set_num_threads(threads);
    failures += expect_true(first == serial, "encoded bytes must not depend on the thread count");
#endif
    return failures;
}

} // namespace

int main()
{
    gcm::global_log_profile = gcm::LogProfile::quiet;

    int failures = 0;
    failures += test_single_gas_scenario();
    failures += test_header_and_binary_layout();
    failures += test_two_aerosol_scenario();
    failures += test_full_planet_order_agreement();
    failures += test_descriptor_round_trip();
    failures += test_axes();
    failures += test_construction_errors();
    failures += test_unknown_species_in_header();
    failures += test_gas_table_covers_hitran_molecules();
    failures += test_content_is_deterministic();

    if (failures > 0)
    {
        std::cerr << "[planet-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[planet-regression] all checks passed" << std::endl;
    return 0;
}
