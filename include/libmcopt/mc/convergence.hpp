#pragma once

#include "libmcopt/core/constants.hpp"
#include "libmcopt/core/types.hpp"
#include "libmcopt/rng/normal_generator.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcopt::mc {

struct ConvergenceConfig {
    int min_simulations = LADDER_MIN_SIMULATIONS;
    int max_simulations = LADDER_MAX_SIMULATIONS;
    int points = LADDER_POINTS;
    int num_steps = LADDER_NUM_STEPS;
    std::optional<std::uint64_t> seed;
};

struct ConvergenceResult {
    std::vector<int> simulations;      // ladder
    std::vector<double> mc_call;       // MC call price per ladder point
    std::vector<double> analytic_call; // Black-Scholes call, repeated
};

// points values linearly spaced over [min_simulations, max_simulations],
// endpoints included, truncated toward zero.
std::vector<int> sample_ladder(const ConvergenceConfig& cfg);

// Every ladder point is an independent simulation; nothing is reused.
ConvergenceResult analyze_convergence(const ModelParameters& params, Method method,
                                      const ConvergenceConfig& cfg = {});

ConvergenceResult analyze_convergence(const ModelParameters& params, Method method,
                                      const ConvergenceConfig& cfg, rng::NormalGenerator& gen);

ConvergenceResult analyze_convergence(const ModelParameters& params, const std::string& method,
                                      const ConvergenceConfig& cfg = {});

} // namespace mcopt::mc
