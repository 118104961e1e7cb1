/**
 * @file field_validation.cpp
 * @brief Implementation for the validation module.
 *
 * Computes field statistics under OpenMP reductions, turns them into
 * policy-graded violations, and serializes the planet report to JSON.
 * This file is part of the src/validation subsystem.
 */

#include "field_validation.hpp"

#include "gcm_errors.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

namespace gcm {
namespace {

/**
 * @brief Returns true when strict mode should fail on non-finite values.
 */
bool should_fail_on_nonfinite(const ValidationPolicy& policy) {
    return policy.fail_on == GuardFailOn::NonFinite || policy.fail_on == GuardFailOn::Both;
}

/**
 * @brief Returns true when strict mode should fail on bounds violations.
 */
bool should_fail_on_bounds(const ValidationPolicy& policy) {
    return policy.fail_on == GuardFailOn::Bounds || policy.fail_on == GuardFailOn::Both;
}

bool has_bounds(const FieldBounds& bounds) {
    return bounds.has_min || bounds.has_max;
}

/**
 * @brief Rescales bounds by a positive unit conversion factor.
 */
FieldBounds scaled_bounds(const FieldBounds& bounds, double factor) {
    FieldBounds out = bounds;
    out.min_value = bounds.min_value * factor;
    out.max_value = bounds.max_value * factor;
    return out;
}

/**
 * @brief Resolves the contract of the i-th field behind an active variable.
 */
const FieldContract& contract_for_variable(const ActiveVariable& variable, std::size_t index) {
    if (variable.kind == FieldKind::WindU && index == 1) {
        return contract_for(FieldKind::WindV);
    }
    return contract_for(variable.kind);
}

void append_string_array(std::ostringstream& oss, const std::vector<std::string>& values) {
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "\"" << strutil::json_escape(values[i]) << "\"";
    }
    oss << "]";
}

}

/**
 * @brief Parses guard mode text into enum representation.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode) {
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "off") {
        out_mode = GuardMode::Off;
        return true;
    }
    if (v == "report") {
        out_mode = GuardMode::Report;
        return true;
    }
    if (v == "strict") {
        out_mode = GuardMode::Strict;
        return true;
    }
    return false;
}

/**
 * @brief Parses strict-failure criterion text into enum representation.
 */
bool parse_guard_fail_on(const std::string& value, GuardFailOn& out_mode) {
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "nonfinite") {
        out_mode = GuardFailOn::NonFinite;
        return true;
    }
    if (v == "bounds") {
        out_mode = GuardFailOn::Bounds;
        return true;
    }
    if (v == "both") {
        out_mode = GuardFailOn::Both;
        return true;
    }
    return false;
}

const char* to_string(GuardMode mode) {
    switch (mode) {
        case GuardMode::Off:
            return "off";
        case GuardMode::Report:
            return "report";
        case GuardMode::Strict:
            return "strict";
        default:
            return "off";
    }
}

const char* to_string(GuardFailOn fail_on) {
    switch (fail_on) {
        case GuardFailOn::NonFinite:
            return "nonfinite";
        case GuardFailOn::Bounds:
            return "bounds";
        case GuardFailOn::Both:
            return "both";
        default:
            return "both";
    }
}

/**
 * @brief Resolves effective bounds after applying policy overrides.
 */
FieldBounds effective_bounds_for_field(const FieldContract& contract,
                                       const std::string& field_name,
                                       const ValidationPolicy& policy) {
    auto it = policy.field_overrides.find(field_name);
    if (it != policy.field_overrides.end()) {
        return it->second;
    }

    it = policy.field_overrides.find(contract.id);
    if (it != policy.field_overrides.end()) {
        return it->second;
    }

    return contract.default_bounds;
}

FieldStats compute_field_stats(const Field& field, const FieldBounds& bounds) {
    FieldStats stats;
    const std::vector<float>& values = field.flat();
    const std::size_t count = values.size();
    stats.total_count = count;

    const bool bounds_enabled = has_bounds(bounds);

    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();

    #pragma omp parallel for reduction(+:finite_count,nan_count,inf_count,below_min_count,above_max_count,finite_sum) reduction(min:finite_min) reduction(max:finite_max)
    for (long long i = 0; i < static_cast<long long>(count); ++i) {
        const double value = static_cast<double>(values[static_cast<std::size_t>(i)]);

        if (!std::isfinite(value)) {
            if (std::isnan(value)) {
                ++nan_count;
            } else {
                ++inf_count;
            }
            continue;
        }

        ++finite_count;
        finite_sum += value;
        finite_min = std::min(finite_min, value);
        finite_max = std::max(finite_max, value);

        if (bounds_enabled) {
            if (bounds.has_min && value < bounds.min_value) {
                ++below_min_count;
            }
            if (bounds.has_max && value > bounds.max_value) {
                ++above_max_count;
            }
        }
    }

    stats.finite_count = finite_count;
    stats.nan_count = nan_count;
    stats.inf_count = inf_count;
    stats.below_min_count = below_min_count;
    stats.above_max_count = above_max_count;

    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = finite_min;
        stats.max_value = finite_max;
        stats.mean_value = finite_sum / static_cast<double>(stats.finite_count);
    }
    return stats;
}

FieldValidationResult validate_field(const Field& field,
                                     const FieldContract& contract,
                                     const ValidationPolicy& policy) {
    FieldValidationResult out;
    if (policy.mode == GuardMode::Off) {
        return out;
    }

    const bool strict = policy.mode == GuardMode::Strict;
    FieldBounds bounds = effective_bounds_for_field(contract, field.name(), policy);
    bool unit_ok = true;
    try {
        const double factor = declared_unit(contract.kind).conversion_factor_to(field.unit());
        bounds = scaled_bounds(bounds, factor);
    } catch (const UnitIncompatible& e) {
        unit_ok = false;
        FieldViolation violation;
        violation.field_name = field.name();
        violation.reason = "incompatible_unit";
        violation.count = field.size();
        violation.critical = strict;
        out.violations.push_back(violation);
        if (log_debug_enabled()) {
            std::cerr << "[VALIDATION] " << field.name() << ": " << e.what() << std::endl;
        }
    }

    out.stats = compute_field_stats(field, unit_ok ? bounds : FieldBounds{});
    const FieldStats& stats = out.stats;

    const std::size_t nonfinite_count = stats.nan_count + stats.inf_count;
    if (nonfinite_count > 0) {
        FieldViolation violation;
        violation.field_name = field.name();
        violation.reason = "non_finite";
        violation.count = nonfinite_count;
        violation.critical = strict && should_fail_on_nonfinite(policy);
        out.violations.push_back(violation);
    }

    const std::size_t bounds_count = stats.below_min_count + stats.above_max_count;
    if (bounds_count > 0) {
        FieldViolation violation;
        violation.field_name = field.name();
        violation.reason = "out_of_bounds";
        violation.count = bounds_count;
        violation.critical = strict && should_fail_on_bounds(policy);
        out.violations.push_back(violation);
    }

    out.failed = std::any_of(out.violations.begin(), out.violations.end(),
                             [](const FieldViolation& v) { return v.critical; });
    return out;
}

ValidationReport validate_planet(const Planet& planet, const ValidationPolicy& policy) {
    ValidationReport report;
    report.context = planet.description();
    report.guard_mode = to_string(policy.mode);
    report.guard_fail_on = to_string(policy.fail_on);
    if (policy.mode == GuardMode::Off) {
        return report;
    }

    for (const ActiveVariable& variable : planet.active_variables()) {
        for (std::size_t i = 0; i < variable.fields.size(); ++i) {
            const Field& field = *variable.fields[i];
            const FieldContract& contract = contract_for_variable(variable, i);

            FieldValidationReport entry;
            entry.field_name = field.name();
            entry.kind = contract.id;
            entry.unit = field.unit().symbol();
            entry.result = validate_field(field, contract, policy);

            for (const FieldViolation& violation : entry.result.violations) {
                if (log_normal_enabled()) {
                    std::cerr << "[VALIDATION] " << (violation.critical ? "Error" : "Warning") << ": field "
                              << violation.field_name << " " << violation.reason
                              << " count=" << violation.count << std::endl;
                }
            }
            if (log_debug_enabled() && entry.result.stats.has_finite) {
                std::cout << "[VALIDATION] " << field.name()
                          << " min=" << entry.result.stats.min_value
                          << " max=" << entry.result.stats.max_value
                          << " mean=" << entry.result.stats.mean_value << std::endl;
            }

            report.failed = report.failed || entry.result.failed;
            report.fields.push_back(std::move(entry));
        }
    }
    return report;
}

/**
 * @brief Serializes a validation report to formatted JSON.
 */
std::string validation_report_to_json(const ValidationReport& report) {
    std::vector<std::string> failed_fields;
    for (const auto& field : report.fields) {
        if (field.result.failed) {
            failed_fields.push_back(field.field_name);
        }
    }

    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"context\": \"" << strutil::json_escape(report.context) << "\",\n";
    oss << "  \"guard_mode\": \"" << strutil::json_escape(report.guard_mode) << "\",\n";
    oss << "  \"guard_fail_on\": \"" << strutil::json_escape(report.guard_fail_on) << "\",\n";
    oss << "  \"failed\": " << (report.failed ? "true" : "false") << ",\n";
    oss << "  \"failed_fields\": ";
    append_string_array(oss, failed_fields);
    oss << ",\n";

    oss << "  \"fields\": [\n";
    for (std::size_t i = 0; i < report.fields.size(); ++i) {
        const auto& field = report.fields[i];
        const auto& stats = field.result.stats;
        oss << "    {\n";
        oss << "      \"field\": \"" << strutil::json_escape(field.field_name) << "\",\n";
        oss << "      \"kind\": \"" << strutil::json_escape(field.kind) << "\",\n";
        oss << "      \"unit\": \"" << strutil::json_escape(field.unit) << "\",\n";
        oss << "      \"failed\": " << (field.result.failed ? "true" : "false") << ",\n";
        oss << "      \"stats\": {\n";
        oss << "        \"total_count\": " << stats.total_count << ",\n";
        oss << "        \"finite_count\": " << stats.finite_count << ",\n";
        oss << "        \"nan_count\": " << stats.nan_count << ",\n";
        oss << "        \"inf_count\": " << stats.inf_count << ",\n";
        oss << "        \"below_min_count\": " << stats.below_min_count << ",\n";
        oss << "        \"above_max_count\": " << stats.above_max_count << ",\n";
        oss << "        \"has_finite\": " << (stats.has_finite ? "true" : "false") << ",\n";
        oss << std::setprecision(9);
        oss << "        \"min\": " << stats.min_value << ",\n";
        oss << "        \"max\": " << stats.max_value << ",\n";
        oss << "        \"mean\": " << stats.mean_value << "\n";
        oss << "      },\n";
        oss << "      \"violations\": [";
        for (std::size_t j = 0; j < field.result.violations.size(); ++j) {
            if (j > 0) {
                oss << ", ";
            }
            const auto& violation = field.result.violations[j];
            oss << "{\"reason\":\"" << strutil::json_escape(violation.reason)
                << "\",\"count\":" << violation.count
                << ",\"critical\":" << (violation.critical ? "true" : "false") << "}";
        }
        oss << "]\n";
        oss << "    }";
        if (i + 1 < report.fields.size()) {
            oss << ",";
        }
        oss << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

}
