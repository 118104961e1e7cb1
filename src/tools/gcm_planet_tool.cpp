/**
 * @file gcm_planet_tool.cpp
 * @brief Implementation for the tools module.
 *
 * Loads a planet configuration, builds and validates the Planet, and
 * either summarizes the PSG header or streams the encoded bytes to stdout.
 * This file is part of the src/tools subsystem.
 */

#include "field_validation.hpp"
#include "gcm_errors.hpp"
#include "logging.hpp"
#include "planet.hpp"
#include "planet_builder.hpp"
#include "runtime_config.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitArguments = 1;
constexpr int kExitInput = 2;
constexpr int kExitValidation = 3;

/**
 * @brief Parsed command-line options for the planet tool.
 */
struct Options {
    std::string config_path;
    bool emit = false;
    bool report = false;
    std::optional<gcm::LogProfile> log_profile;
    std::optional<gcm::GuardMode> validation_mode;
};

/**
 * @brief Parse outcomes for command-line argument processing.
 */
enum class ParseArgsResult {
    Ok,
    Help,
    Error,
};

/**
 * @brief Prints CLI usage help for the planet tool.
 */
void print_usage() {
    std::cout << "GCM Planet Tool\n"
              << "Usage:\n"
              << "  bin/gcm_planet_tool --config <file> [--summary|--emit] [--report]\n"
              << "      [--log quiet|normal|debug] [--validation off|report|strict]\n"
              << "\n"
              << "  --summary   print the PSG parameter table and buffer sizes (default)\n"
              << "  --emit      write the encoded header and binary payload to stdout\n"
              << "  --report    print the field validation report as JSON (summary mode)\n";
}

/**
 * @brief Parses CLI arguments into an `Options` structure.
 */
ParseArgsResult parse_args(int argc, char** argv, Options& out) {
    bool summary_requested = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto require_value = [&](const std::string& option) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return ParseArgsResult::Help;
        }
        if (arg == "--config") {
            const char* value = require_value(arg);
            if (value == nullptr) {
                return ParseArgsResult::Error;
            }
            out.config_path = value;
            continue;
        }
        if (arg == "--summary") {
            summary_requested = true;
            continue;
        }
        if (arg == "--emit") {
            out.emit = true;
            continue;
        }
        if (arg == "--report") {
            out.report = true;
            continue;
        }
        if (arg == "--log") {
            const char* value = require_value(arg);
            if (value == nullptr) {
                return ParseArgsResult::Error;
            }
            bool valid = false;
            out.log_profile = gcm::parse_log_profile(value, &valid);
            if (!valid) {
                std::cerr << "--log must be quiet, normal or debug\n";
                return ParseArgsResult::Error;
            }
            continue;
        }
        if (arg == "--validation") {
            const char* value = require_value(arg);
            if (value == nullptr) {
                return ParseArgsResult::Error;
            }
            gcm::GuardMode mode = gcm::GuardMode::Report;
            if (!gcm::parse_guard_mode(value, mode)) {
                std::cerr << "--validation must be off, report or strict\n";
                return ParseArgsResult::Error;
            }
            out.validation_mode = mode;
            continue;
        }

        std::cerr << "Unknown argument: " << arg << "\n";
        return ParseArgsResult::Error;
    }

    if (out.config_path.empty()) {
        std::cerr << "--config is required\n";
        return ParseArgsResult::Error;
    }
    if (summary_requested && out.emit) {
        std::cerr << "--summary and --emit are mutually exclusive\n";
        return ParseArgsResult::Error;
    }
    if (out.emit && out.report) {
        std::cerr << "--report is only available in summary mode\n";
        return ParseArgsResult::Error;
    }
    return ParseArgsResult::Ok;
}

/**
 * @brief Prints the parameter table and buffer sizes.
 */
void print_summary(const gcm::Planet& planet) {
    for (const auto& param : planet.psg_params()) {
        std::cout << "<" << param.first << ">" << param.second << "\n";
    }

    const std::vector<float> payload = planet.flat();
    const std::size_t content_bytes = planet.content().size();
    std::cout << "[GCM] grid " << planet.shape().to_string()
              << " payload_floats=" << payload.size()
              << " payload_bytes=" << payload.size() * sizeof(float)
              << " content_bytes=" << content_bytes << std::endl;
}

}

/**
 * @brief Entry point for building and encoding a planet GCM from a config file.
 */
int main(int argc, char** argv) {
    Options options;
    const ParseArgsResult parse_result = parse_args(argc, argv, options);
    if (parse_result == ParseArgsResult::Help) {
        return kExitOk;
    }
    if (parse_result == ParseArgsResult::Error) {
        return kExitArguments;
    }

    try {
        const gcm::ConfigEntries entries = gcm::parse_yaml_file(options.config_path);
        gcm::apply_logging_config(entries);
        if (options.log_profile) {
            gcm::global_log_profile = *options.log_profile;
        }
        // stdout carries the binary artifact in emit mode
        if (options.emit) {
            gcm::global_log_profile = gcm::LogProfile::quiet;
        }

        gcm::PlanetConfig config = gcm::parse_planet_config(entries);
        if (options.validation_mode) {
            config.validation.mode = *options.validation_mode;
        }

        const gcm::Planet planet = gcm::build_planet(config);
        const gcm::ValidationReport report = gcm::validate_planet(planet, config.validation);

        if (report.failed) {
            std::cerr << "[GCM] Error: strict field validation failed for config "
                      << options.config_path << std::endl;
            if (options.report) {
                std::cout << gcm::validation_report_to_json(report);
            }
            return kExitValidation;
        }

        if (options.emit) {
            const std::vector<std::uint8_t> bytes = planet.content();
            std::cout.write(reinterpret_cast<const char*>(bytes.data()),
                            static_cast<std::streamsize>(bytes.size()));
            std::cout.flush();
            if (!std::cout) {
                std::cerr << "[GCM] Error: failed to write encoded planet to stdout" << std::endl;
                return kExitInput;
            }
            return kExitOk;
        }

        print_summary(planet);
        if (options.report) {
            std::cout << gcm::validation_report_to_json(report);
        }
    } catch (const gcm::ConfigError& e) {
        std::cerr << "[GCM] Config error: " << e.what() << std::endl;
        return kExitInput;
    } catch (const gcm::UnitIncompatible& e) {
        std::cerr << "[GCM] Unit error: " << e.what() << std::endl;
        return kExitInput;
    } catch (const gcm::UnknownSpecies& e) {
        std::cerr << "[GCM] Species error: " << e.what() << std::endl;
        return kExitInput;
    } catch (const gcm::ShapeMismatch& e) {
        std::cerr << "[GCM] Shape error: " << e.what() << std::endl;
        return kExitInput;
    } catch (const std::exception& e) {
        std::cerr << "[GCM] Error: " << e.what() << std::endl;
        return kExitInput;
    }

    return kExitOk;
}
