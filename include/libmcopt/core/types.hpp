#pragma once

#include "libmcopt/core/constants.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mcopt {

struct ModelParameters {
    double S0;
    double K;
    double T;
    double r;
    double sigma;
    double q = 0.0;
};

enum class Method { Standard, Antithetic, ControlVariate };

enum class OptionType { Call, Put };

struct SimulationConfig {
    int num_simulations = DEFAULT_NUM_SIMULATIONS;
    int num_steps = DEFAULT_NUM_STEPS;
    Method method = Method::Standard;
    // Unset: a fresh generator seeded from std::random_device
    std::optional<std::uint64_t> seed;
};

// "standard", "antithetic", "control_variate"
Method parse_method(const std::string& name);
std::string to_string(Method method);

// "call", "put" (case-insensitive)
OptionType parse_option_type(const std::string& name);
std::string to_string(OptionType type);

// Throw InvalidParameter naming the first offending field.
void validate(const ModelParameters& params);
void validate(const SimulationConfig& cfg);

} // namespace mcopt
