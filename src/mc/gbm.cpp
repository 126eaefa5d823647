#include "libmcopt/mc/gbm.hpp"
#include "libmcopt/core/constants.hpp"
#include "libmcopt/mc/path_simulator.hpp"

#include <numeric>
#include <utility>

namespace mcopt::mc {

namespace {

std::unique_ptr<rng::NormalGenerator> generator_for(const SimulationConfig& cfg) {
    return cfg.seed ? rng::make_generator(*cfg.seed) : rng::make_generator();
}

} // namespace

EstimationResult simulate(const ModelParameters& params, const SimulationConfig& cfg) {
    validate(params);
    validate(cfg);
    auto gen = generator_for(cfg);
    return simulate(params, cfg, *gen);
}

EstimationResult simulate(const ModelParameters& params, const SimulationConfig& cfg,
                          rng::NormalGenerator& gen) {
    validate(params);
    validate(cfg);

    const bool antithetic = cfg.method == Method::Antithetic;
    TerminalSample sample = simulate_terminal(params, cfg.num_steps, cfg.num_simulations,
                                              antithetic, gen, PATH_SUBSAMPLE);

    EstimationResult res = estimate_prices(sample.terminal, params, cfg.method);
    res.paths = std::move(sample.sample_paths);
    res.steps.resize(static_cast<std::size_t>(cfg.num_steps + 1));
    std::iota(res.steps.begin(), res.steps.end(), 0);
    return res;
}

Estimate price_option(const ModelParameters& params, OptionType type, const SimulationConfig& cfg) {
    validate(params);
    validate(cfg);
    auto gen = generator_for(cfg);
    return price_option(params, type, cfg, *gen);
}

Estimate price_option(const ModelParameters& params, OptionType type, const SimulationConfig& cfg,
                      rng::NormalGenerator& gen) {
    validate(params);
    validate(cfg);

    const bool antithetic = cfg.method == Method::Antithetic;
    const TerminalSample sample = simulate_terminal(params, cfg.num_steps, cfg.num_simulations,
                                                    antithetic, gen, 0);
    return estimate(sample.terminal, params, cfg.method, type);
}

} // namespace mcopt::mc
