#pragma once

#include "libmcopt/core/types.hpp"
#include "libmcopt/mc/estimator.hpp"
#include "libmcopt/rng/normal_generator.hpp"

namespace mcopt::mc {

// Simulate cfg.num_simulations GBM paths of cfg.num_steps steps and price the
// call and put with cfg.method. The result carries the first
// min(PATH_SUBSAMPLE, n) paths and the step grid.
//
// Parameters are validated before any draw. Without an explicit generator a
// fresh one is built from cfg.seed (or std::random_device when unset).
EstimationResult simulate(const ModelParameters& params, const SimulationConfig& cfg);

EstimationResult simulate(const ModelParameters& params, const SimulationConfig& cfg,
                          rng::NormalGenerator& gen);

// One leg only; no path subsample is kept.
Estimate price_option(const ModelParameters& params, OptionType type, const SimulationConfig& cfg);

Estimate price_option(const ModelParameters& params, OptionType type, const SimulationConfig& cfg,
                      rng::NormalGenerator& gen);

} // namespace mcopt::mc
