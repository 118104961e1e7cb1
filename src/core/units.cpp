/**
 * @file units.cpp
 * @brief Unit table, unit-expression parsing, and quantity conversion.
 *
 * Implements the dimension-checked conversion capability consumed by the
 * field factories and the configuration builder.
 */

#include "units.hpp"

#include "gcm_errors.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace gcm
{
namespace
{

namespace pc = physical_constants;

Dimension dim(int length, int mass, int time, int temperature = 0, int amount = 0)
{
    Dimension d;
    d.length = length;
    d.mass = mass;
    d.time = time;
    d.temperature = temperature;
    d.amount = amount;
    return d;
}

const std::unordered_map<std::string, Unit>& unit_table()
{
    static const std::unordered_map<std::string, Unit> table = [] {
        const Dimension none{};
        const Dimension length = dim(1, 0, 0);
        const Dimension mass = dim(0, 1, 0);
        const Dimension time = dim(0, 0, 1);
        const Dimension pressure = dim(-1, 1, -2);
        const Dimension energy = dim(2, 1, -2);
        const Dimension power = dim(2, 1, -3);

        std::unordered_map<std::string, Unit> t;
        auto add = [&t](const std::string& symbol, double scale, const Dimension& d) {
            t.emplace(symbol, Unit(scale, d, symbol));
        };

        add("1", 1.0, none);
        add("dimensionless", 1.0, none);
        add("%", 1.0e-2, none);
        add("ppm", 1.0e-6, none);
        add("ppb", 1.0e-9, none);

        add("m", 1.0, length);
        add("cm", 1.0e-2, length);
        add("mm", 1.0e-3, length);
        add("um", 1.0e-6, length);
        add("micron", 1.0e-6, length);
        add("nm", 1.0e-9, length);
        add("km", 1.0e3, length);
        add("AA", 1.0e-10, length);
        add("AU", pc::astronomical_unit_m, length);
        add("R_sun", pc::solar_radius_m, length);
        add("R_earth", pc::earth_radius_m, length);
        add("R_jup", pc::jupiter_radius_m, length);
        add("pc", pc::parsec_m, length);

        add("kg", 1.0, mass);
        add("g", 1.0e-3, mass);

        add("s", 1.0, time);
        add("min", 60.0, time);
        add("h", 3600.0, time);
        add("hr", 3600.0, time);
        add("day", 86400.0, time);
        add("yr", pc::julian_year_s, time);

        add("K", 1.0, dim(0, 0, 0, 1));
        add("mol", 1.0, dim(0, 0, 0, 0, 1));

        add("Pa", 1.0, pressure);
        add("hPa", 1.0e2, pressure);
        add("kPa", 1.0e3, pressure);
        add("mbar", 1.0e2, pressure);
        add("bar", pc::bar_pa, pressure);
        add("atm", pc::atmosphere_pa, pressure);

        add("J", 1.0, energy);
        add("W", 1.0, power);
        return t;
    }();
    return table;
}

std::string describe_dimension(const Dimension& d)
{
    if (d.is_dimensionless())
    {
        return "dimensionless";
    }
    std::ostringstream oss;
    auto term = [&oss](const char* base, int exponent) {
        if (exponent == 0)
        {
            return;
        }
        if (oss.tellp() > 0)
        {
            oss << " ";
        }
        oss << base;
        if (exponent != 1)
        {
            oss << "^" << exponent;
        }
    };
    term("L", d.length);
    term("M", d.mass);
    term("T", d.time);
    term("Theta", d.temperature);
    term("N", d.amount);
    return oss.str();
}

Unit lookup_symbol(const std::string& symbol, const std::string& expression)
{
    const auto& table = unit_table();
    const auto it = table.find(symbol);
    if (it == table.end())
    {
        throw UnitIncompatible("unrecognized unit symbol '" + symbol + "' in '" + expression + "'");
    }
    return it->second;
}

/**
 * @brief Parses one `symbol[^exponent]` factor.
 */
Unit parse_factor(const std::string& factor, const std::string& expression)
{
    const std::size_t caret = factor.find('^');
    if (caret == std::string::npos)
    {
        return lookup_symbol(factor, expression);
    }

    const std::string base = factor.substr(0, caret);
    const std::string exponent_text = factor.substr(caret + 1);
    char* end = nullptr;
    const long exponent = std::strtol(exponent_text.c_str(), &end, 10);
    if (exponent_text.empty() || end == nullptr || *end != '\0')
    {
        throw UnitIncompatible("malformed exponent in unit '" + expression + "'");
    }
    return lookup_symbol(base, expression).pow(static_cast<int>(exponent));
}

}

double Unit::conversion_factor_to(const Unit& target) const
{
    if (!convertible_to(target))
    {
        throw UnitIncompatible("cannot convert '" + (symbol_.empty() ? std::string("1") : symbol_) +
                               "' [" + describe_dimension(dimension_) + "] to '" +
                               (target.symbol_.empty() ? std::string("1") : target.symbol_) +
                               "' [" + describe_dimension(target.dimension_) + "]");
    }
    return scale_ / target.scale_;
}

Unit Unit::operator*(const Unit& other) const
{
    Dimension d;
    d.length = dimension_.length + other.dimension_.length;
    d.mass = dimension_.mass + other.dimension_.mass;
    d.time = dimension_.time + other.dimension_.time;
    d.temperature = dimension_.temperature + other.dimension_.temperature;
    d.amount = dimension_.amount + other.dimension_.amount;

    std::string symbol = symbol_;
    if (!other.symbol_.empty())
    {
        symbol = symbol.empty() ? other.symbol_ : symbol + " " + other.symbol_;
    }
    return Unit(scale_ * other.scale_, d, symbol);
}

Unit Unit::operator/(const Unit& other) const
{
    Unit inverse = other.pow(-1);
    Unit out = (*this) * inverse;
    std::string symbol = symbol_.empty() ? std::string("1") : symbol_;
    if (!other.symbol_.empty())
    {
        symbol += "/" + other.symbol_;
    }
    return Unit(out.scale(), out.dimension(), symbol);
}

Unit Unit::pow(int exponent) const
{
    Dimension d;
    d.length = dimension_.length * exponent;
    d.mass = dimension_.mass * exponent;
    d.time = dimension_.time * exponent;
    d.temperature = dimension_.temperature * exponent;
    d.amount = dimension_.amount * exponent;

    std::string symbol = symbol_;
    if (exponent != 1 && !symbol_.empty())
    {
        symbol += "^" + std::to_string(exponent);
    }
    return Unit(std::pow(scale_, exponent), d, symbol);
}

Unit parse_unit(const std::string& text)
{
    const std::string expression = strutil::trim_copy(text);
    if (expression.empty() || expression == "1" || expression == "dimensionless")
    {
        return Unit::dimensionless();
    }

    Unit result = Unit::dimensionless();
    std::string factor;
    bool dividing = false;

    auto flush = [&]() {
        if (factor.empty())
        {
            return;
        }
        const Unit parsed = parse_factor(factor, expression);
        result = dividing ? result / parsed : result * parsed;
        factor.clear();
        dividing = false;
    };

    for (char c : expression)
    {
        if (c == '*' || std::isspace(static_cast<unsigned char>(c)))
        {
            flush();
            continue;
        }
        if (c == '/')
        {
            flush();
            if (dividing)
            {
                throw UnitIncompatible("malformed unit expression '" + expression + "'");
            }
            dividing = true;
            continue;
        }
        factor.push_back(c);
    }

    if (dividing && factor.empty())
    {
        throw UnitIncompatible("unit expression '" + expression + "' ends with '/'");
    }
    flush();
    return Unit(result.scale(), result.dimension(), expression);
}

double Quantity::to(const Unit& target) const
{
    return value * unit.conversion_factor_to(target);
}

std::string Quantity::to_string() const
{
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    if (!unit.symbol().empty())
    {
        oss << " " << unit.symbol();
    }
    return oss.str();
}

Quantity parse_quantity(const std::string& text)
{
    const std::string trimmed = strutil::trim_copy(text);
    if (trimmed.empty())
    {
        throw std::invalid_argument("empty quantity");
    }

    std::size_t consumed = 0;
    double value = 0.0;
    try
    {
        value = std::stod(trimmed, &consumed);
    }
    catch (const std::exception&)
    {
        throw std::invalid_argument("malformed number in quantity '" + trimmed + "'");
    }
    if (!std::isfinite(value))
    {
        throw std::invalid_argument("non-finite number in quantity '" + trimmed + "'");
    }

    return Quantity(value, parse_unit(trimmed.substr(consumed)));
}

bool is_close(const Quantity& a, const Quantity& b, const Quantity& tolerance)
{
    const double lhs = a.to(tolerance.unit);
    const double rhs = b.to(tolerance.unit);
    return std::abs(lhs - rhs) <= std::abs(tolerance.value);
}

} // namespace gcm
