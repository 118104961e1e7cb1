#include "gcm_errors.hpp"
#include "grid_field.hpp"
#include "units.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

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
        std::cerr << "[field-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-6)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[field-regression] FAIL: " << label
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
        std::cerr << "[field-regression] FAIL: " << message << " (unexpected exception: " << e.what() << ")"
                  << std::endl;
        return 1;
    }
    std::cerr << "[field-regression] FAIL: " << message << " (no exception)" << std::endl;
    return 1;
}

int test_grid_shape_rules()
{
    int failures = 0;
    const gcm::GridShape volume = gcm::GridShape::volume(4, 3, 2);
    failures += expect_true(volume.is_volume() && !volume.is_surface(), "volume shape must report rank 3");
    failures += expect_true(volume.element_count() == 24, "volume element count must be 24");
    failures += expect_true(volume.horizontal() == gcm::GridShape::surface(3, 2), "horizontal of (4,3,2) is (3,2)");
    failures += expect_true(volume.to_string() == "(4, 3, 2)", "shape formatting must be '(4, 3, 2)'");

    failures += expect_throws<gcm::ShapeMismatch>([] { (void)gcm::GridShape(std::vector<int>{5}); }, "rank-1 shape must be rejected");
    failures += expect_throws<gcm::ShapeMismatch>([] { (void)gcm::GridShape(std::vector<int>{1, 2, 3, 4}); },
                                                  "rank-4 shape must be rejected");
    failures += expect_throws<gcm::ShapeMismatch>([] { (void)gcm::GridShape::volume(2, 0, 3); },
                                                  "zero extent must be rejected");
    failures += expect_throws<gcm::ShapeMismatch>([] { (void)gcm::GridShape::surface(-1, 3); },
                                                  "negative extent must be rejected");
    failures += expect_throws<gcm::ShapeMismatch>([] { (void)gcm::GridShape::surface(2, 2).horizontal(); },
                                                  "horizontal() of a surface shape must be rejected");
    return failures;
}

int test_constant_and_quantity_factories()
{
    int failures = 0;
    const gcm::GridShape shape = gcm::GridShape::volume(2, 3, 4);
    const gcm::Field field = gcm::Field::constant("H2O", gcm::Unit::dimensionless(), 1.0e-3, shape);
    failures += expect_true(field.size() == shape.element_count(), "constant field size must match its shape");
    bool all_equal = true;
    for (float v : field.flat())
    {
        all_equal = all_equal && v == static_cast<float>(1.0e-3);
    }
    failures += expect_true(all_equal, "constant field must hold one value everywhere");

    const gcm::Field pressure =
        gcm::Field::from_quantity("Pressure", gcm::parse_unit("Pa"), gcm::parse_quantity("2 bar"), shape);
    failures += expect_close(pressure.at(1, 2, 3), 2.0e5, "2 bar stored in Pa", 1.0e-2);
    failures += expect_true(pressure.unit().symbol() == "Pa", "field keeps its declared unit symbol");

    failures += expect_throws<gcm::UnitIncompatible>(
        [&] { gcm::Field::from_quantity("U", gcm::parse_unit("m/s"), gcm::parse_quantity("3 K"), shape); },
        "temperature quantity in a wind field must raise UnitIncompatible");
    return failures;
}

int test_from_values_row_major_layout()
{
    int failures = 0;
    const gcm::GridShape shape = gcm::GridShape::volume(2, 2, 3);
    std::vector<double> values(shape.element_count());
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        values[i] = static_cast<double>(i);
    }
    const gcm::Field field = gcm::Field::from_values("T", gcm::parse_unit("K"), values, shape);
    failures += expect_close(field.at(0, 0, 2), 2.0, "last axis is fastest");
    failures += expect_close(field.at(0, 1, 0), 3.0, "middle axis stride is n_lat");
    failures += expect_close(field.at(1, 0, 0), 6.0, "first axis stride is n_lon*n_lat");

    const gcm::Field surface =
        gcm::Field::from_values("Tsurf", gcm::parse_unit("K"), {1.0, 2.0, 3.0, 4.0}, gcm::GridShape::surface(2, 2));
    failures += expect_close(surface.at(1, 0), 3.0, "surface at(1,0)");

    failures += expect_throws<gcm::ShapeMismatch>(
        [&] { gcm::Field::from_values("T", gcm::parse_unit("K"), {1.0, 2.0}, shape); },
        "wrong element count must raise ShapeMismatch");
    return failures;
}

int test_broadcast_trailing_axes()
{
    int failures = 0;
    const gcm::GridShape target = gcm::GridShape::volume(3, 2, 2);

    const gcm::Field column =
        gcm::Field::broadcast("Pressure", gcm::parse_unit("bar"), {1.0, 0.1, 0.01}, {3, 1, 1}, target);
    failures += expect_close(column.at(0, 1, 1), 1.0, "column layer 0");
    failures += expect_close(column.at(1, 0, 1), 0.1, "column layer 1");
    failures += expect_close(column.at(2, 1, 0), 0.01, "column layer 2");

    const gcm::Field map =
        gcm::Field::broadcast("Tsurf", gcm::parse_unit("K"), {10.0, 20.0, 30.0, 40.0}, {2, 2}, target);
    failures += expect_close(map.at(0, 1, 0), 30.0, "surface map repeats on layer 0");
    failures += expect_close(map.at(2, 1, 0), 30.0, "surface map repeats on layer 2");

    const gcm::Field scalar = gcm::Field::broadcast("c", gcm::Unit::dimensionless(), {7.0}, {}, target);
    failures += expect_close(scalar.at(2, 1, 1), 7.0, "scalar broadcast fills the grid");

    failures += expect_throws<gcm::ShapeMismatch>(
        [&] { gcm::Field::broadcast("bad", gcm::Unit::dimensionless(), {1.0, 2.0, 3.0}, {3}, target); },
        "3 does not broadcast against trailing n_lat=2");
    failures += expect_throws<gcm::ShapeMismatch>(
        [&] { gcm::Field::broadcast("bad", gcm::Unit::dimensionless(), {1.0, 2.0}, {3, 1, 1}, target); },
        "value count must match the source shape");
    return failures;
}

int test_append_flat_concatenates()
{
    int failures = 0;
    const gcm::GridShape shape = gcm::GridShape::surface(2, 2);
    const gcm::Field a = gcm::Field::constant("A", gcm::Unit::dimensionless(), 1.0, shape);
    std::vector<float> out;
    gcm::append_flat(out, a);
    gcm::append_flat(out, gcm::Field::constant("C", gcm::Unit::dimensionless(), 2.0, shape));
    failures += expect_true(out.size() == 8, "append_flat concatenates sizes");
    failures += expect_close(out[3], 1.0, "first block precedes second");
    failures += expect_close(out[4], 2.0, "second block follows first");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_grid_shape_rules();
    failures += test_constant_and_quantity_factories();
    failures += test_from_values_row_major_layout();
    failures += test_broadcast_trailing_axes();
    failures += test_append_flat_concatenates();

    if (failures > 0)
    {
        std::cerr << "[field-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[field-regression] all checks passed" << std::endl;
    return 0;
}
