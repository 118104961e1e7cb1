#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "field_contract.hpp"
#include "grid_field.hpp"
#include "planet.hpp"

/**
 * @file field_validation.hpp
 * @brief Read-only quality checks for planet fields.
 *
 * Defines the guard policy, per-field statistics, violations and the
 * planet-level report. Validation never modifies a field: a planet is
 * immutable once built, so the guard can only report or fail.
 */

namespace gcm
{

enum class GuardMode
{
    Off,
    Report,
    Strict,
};

enum class GuardFailOn
{
    NonFinite,
    Bounds,
    Both,
};

struct ValidationPolicy
{
    GuardMode mode = GuardMode::Report;
    GuardFailOn fail_on = GuardFailOn::Both;
    // Keyed by field name (`Tsurf`, `H2O`, `Water_size`) or contract id, in the declared unit.
    // Filled from `validation.field_overrides.<field>.(min|max)`.
    std::unordered_map<std::string, FieldBounds> field_overrides;
};

struct FieldStats
{
    std::size_t total_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    bool has_finite = false;
};

struct FieldViolation
{
    std::string field_name;
    std::string reason;
    std::size_t count = 0;
    bool critical = false;
};

struct FieldValidationResult
{
    FieldStats stats;
    std::vector<FieldViolation> violations;
    bool failed = false;
};

struct FieldValidationReport
{
    std::string field_name;
    std::string kind;
    std::string unit;
    FieldValidationResult result;
};

struct ValidationReport
{
    std::string context;
    std::string guard_mode;
    std::string guard_fail_on;
    bool failed = false;
    std::vector<FieldValidationReport> fields;
};

/**
 * @brief Parses guard mode from text (`off`, `report`, `strict`).
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode);

/**
 * @brief Parses guard failure mode from text (`nonfinite`, `bounds`, `both`).
 */
bool parse_guard_fail_on(const std::string& value, GuardFailOn& out_mode);

const char* to_string(GuardMode mode);
const char* to_string(GuardFailOn fail_on);

/**
 * @brief Resolves field bounds including policy overrides.
 */
FieldBounds effective_bounds_for_field(const FieldContract& contract,
                                       const std::string& field_name,
                                       const ValidationPolicy& policy);

/**
 * @brief Counts finite and non-finite samples and tallies bounds violations.
 *
 * `bounds` must be expressed in the field's own unit. Min, max and mean
 * cover finite samples only.
 */
FieldStats compute_field_stats(const Field& field, const FieldBounds& bounds);

/**
 * @brief Checks one field against its contract under a policy.
 *
 * Contract bounds are converted from the declared unit into the field's
 * unit before counting. A field whose unit cannot be converted records an
 * `incompatible_unit` violation instead of bounds checks.
 */
FieldValidationResult validate_field(const Field& field,
                                     const FieldContract& contract,
                                     const ValidationPolicy& policy);

/**
 * @brief Validates every present field of a planet in payload order.
 *
 * `GuardMode::Off` returns an empty, passing report.
 */
ValidationReport validate_planet(const Planet& planet, const ValidationPolicy& policy);

/**
 * @brief Serializes a validation report to JSON.
 */
std::string validation_report_to_json(const ValidationReport& report);

} // namespace gcm
