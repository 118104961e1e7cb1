#pragma once

#include <string>
#include <utility>

/**
 * @file units.hpp
 * @brief Unit-tagged scalar quantities and dimension-checked conversion.
 *
 * A unit is a scale to SI plus integer exponents over the base
 * dimensions. Conversion between units of different dimension raises
 * gcm::UnitIncompatible instead of coercing.
 */

namespace gcm
{

struct Dimension
{
    int length = 0;
    int mass = 0;
    int time = 0;
    int temperature = 0;
    int amount = 0;

    bool operator==(const Dimension& other) const
    {
        return length == other.length && mass == other.mass && time == other.time &&
               temperature == other.temperature && amount == other.amount;
    }

    bool operator!=(const Dimension& other) const { return !(*this == other); }

    bool is_dimensionless() const { return *this == Dimension{}; }
};

class Unit
{
public:
    /**
     * @brief Constructs the dimensionless unit with scale 1.
     */
    Unit() : scale_(1.0), symbol_("") {}

    Unit(double scale_to_si, Dimension dimension, std::string symbol)
        : scale_(scale_to_si), dimension_(dimension), symbol_(std::move(symbol))
    {
    }

    static Unit dimensionless() { return Unit(); }

    double scale() const { return scale_; }
    const Dimension& dimension() const { return dimension_; }
    const std::string& symbol() const { return symbol_; }

    bool is_dimensionless() const { return dimension_.is_dimensionless(); }

    bool convertible_to(const Unit& other) const { return dimension_ == other.dimension_; }

    /**
     * @brief Returns the factor that maps a value in this unit to `target`.
     * @throws UnitIncompatible when the dimensions differ.
     */
    double conversion_factor_to(const Unit& target) const;

    Unit operator*(const Unit& other) const;
    Unit operator/(const Unit& other) const;
    Unit pow(int exponent) const;

private:
    double scale_;
    Dimension dimension_;
    std::string symbol_;
};

/**
 * @brief Parses a unit expression such as `m/s`, `kg/kg`, `W/m^2` or `bar`.
 *
 * Factors are separated by `*`, `/` or whitespace; each factor may carry
 * an integer exponent (`m^-3`). An empty string, `1` and `dimensionless`
 * denote the dimensionless unit.
 *
 * @throws UnitIncompatible when a symbol is not in the unit table.
 */
Unit parse_unit(const std::string& text);

struct Quantity
{
    double value = 0.0;
    Unit unit;

    Quantity() = default;
    Quantity(double v, Unit u) : value(v), unit(std::move(u)) {}

    /**
     * @brief Converts the quantity to a plain number in `target`.
     * @throws UnitIncompatible when the dimensions differ.
     */
    double to(const Unit& target) const;

    double to(const std::string& target_symbol) const { return to(parse_unit(target_symbol)); }

    std::string to_string() const;
};

/**
 * @brief Parses `"<number> [unit]"`, e.g. `"3300 K"`, `"0.05 AU"` or `"1e-3"`.
 * @throws std::invalid_argument when the number is malformed.
 * @throws UnitIncompatible when the unit is not recognized.
 */
Quantity parse_quantity(const std::string& text);

/**
 * @brief Compares two quantities within an absolute tolerance.
 *
 * Both operands are converted into the unit of `tolerance`.
 *
 * @throws UnitIncompatible when any operand is dimensionally incompatible.
 */
bool is_close(const Quantity& a, const Quantity& b, const Quantity& tolerance);

} // namespace gcm
