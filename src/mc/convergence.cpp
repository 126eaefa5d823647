#include "libmcopt/mc/convergence.hpp"
#include "libmcopt/core/errors.hpp"
#include "libmcopt/mc/gbm.hpp"
#include "libmcopt/models/black_scholes.hpp"

namespace mcopt::mc {

namespace {

void check_ladder(const ConvergenceConfig& cfg) {
    if (cfg.min_simulations <= 0) {
        throw InvalidParameter("numSimulations", "ladder start must be positive, got " +
                                                 std::to_string(cfg.min_simulations));
    }
    if (cfg.max_simulations < cfg.min_simulations) {
        throw InvalidParameter("numSimulations", "ladder end below ladder start");
    }
    if (cfg.points <= 0) {
        throw InvalidParameter("points", "must be a positive integer, got " + std::to_string(cfg.points));
    }
    if (cfg.num_steps <= 0) {
        throw InvalidParameter("numSteps", "must be a positive integer, got " + std::to_string(cfg.num_steps));
    }
}

} // namespace

std::vector<int> sample_ladder(const ConvergenceConfig& cfg) {
    check_ladder(cfg);

    std::vector<int> ladder(static_cast<std::size_t>(cfg.points));
    const double lo = cfg.min_simulations;
    const double hi = cfg.max_simulations;
    if (cfg.points == 1) {
        ladder[0] = cfg.min_simulations;
        return ladder;
    }
    const double step = (hi - lo) / static_cast<double>(cfg.points - 1);
    for (int i = 0; i < cfg.points; ++i) {
        ladder[i] = static_cast<int>(lo + step * i);
    }
    ladder.back() = cfg.max_simulations;
    return ladder;
}

ConvergenceResult analyze_convergence(const ModelParameters& params, Method method,
                                      const ConvergenceConfig& cfg) {
    validate(params);
    check_ladder(cfg);
    auto gen = cfg.seed ? rng::make_generator(*cfg.seed) : rng::make_generator();
    return analyze_convergence(params, method, cfg, *gen);
}

ConvergenceResult analyze_convergence(const ModelParameters& params, Method method,
                                      const ConvergenceConfig& cfg, rng::NormalGenerator& gen) {
    validate(params);
    const std::vector<int> ladder = sample_ladder(cfg);

    // Check the first point's config up front so nothing is drawn on bad input.
    SimulationConfig sim;
    sim.num_steps = cfg.num_steps;
    sim.method = method;
    sim.num_simulations = ladder.front();
    validate(sim);

    const double baseline = bs::price_analytical(params).call;

    ConvergenceResult res;
    res.simulations = ladder;
    res.mc_call.reserve(ladder.size());
    for (int n : ladder) {
        sim.num_simulations = n;
        res.mc_call.push_back(simulate(params, sim, gen).call_price);
    }
    res.analytic_call.assign(ladder.size(), baseline);
    return res;
}

ConvergenceResult analyze_convergence(const ModelParameters& params, const std::string& method,
                                      const ConvergenceConfig& cfg) {
    return analyze_convergence(params, parse_method(method), cfg);
}

} // namespace mcopt::mc
