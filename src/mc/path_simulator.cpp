#include "libmcopt/mc/path_simulator.hpp"
#include "libmcopt/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace mcopt::mc {

namespace {

void check_dimensions(int num_steps, int num_paths) {
    if (num_steps <= 0) {
        throw InvalidParameter("numSteps", "must be a positive integer, got " + std::to_string(num_steps));
    }
    if (num_paths <= 0) {
        throw InvalidParameter("numSimulations", "must be a positive integer, got " + std::to_string(num_paths));
    }
}

struct StepParams {
    double log_S0;
    double drift;    // (r - q - 0.5 sigma^2) dt
    double vol_sdt;  // sigma sqrt(dt)
};

StepParams make_step(const ModelParameters& p, int num_steps) {
    const double dt = p.T / static_cast<double>(num_steps);
    return {std::log(p.S0),
            (p.r - p.q - 0.5 * p.sigma * p.sigma) * dt,
            p.sigma * std::sqrt(dt)};
}

// Calls emit(column, z, sign) once per path; sign is -1 for mirrored columns.
template <class Emit>
void generate(int num_steps, int num_paths, bool antithetic,
              rng::NormalGenerator& gen, Emit&& emit) {
    const int independent = antithetic ? num_paths - num_paths / 2 : num_paths;
    const int mirrored = antithetic ? num_paths / 2 : 0;

    std::vector<double> z(static_cast<std::size_t>(num_steps));
    for (int j = 0; j < independent; ++j) {
        gen.fill(z.data(), z.size());
        emit(j, z, 1.0);
        if (j < mirrored) {
            emit(independent + j, z, -1.0);
        }
    }
}

} // namespace

PathBundle::PathBundle(int num_steps, int num_paths)
    : num_steps_(num_steps), num_paths_(num_paths) {
    check_dimensions(num_steps, num_paths);
    data_.assign(static_cast<std::size_t>(num_steps + 1) * static_cast<std::size_t>(num_paths), 0.0);
}

std::vector<double> PathBundle::terminal() const {
    const auto first = data_.begin() + static_cast<std::ptrdiff_t>(index(num_steps_, 0));
    return std::vector<double>(first, first + num_paths_);
}

std::vector<double> PathBundle::path(int j) const {
    if (j < 0 || j >= num_paths_) {
        throw InvalidParameter("path", "index " + std::to_string(j) + " out of range");
    }
    std::vector<double> out(static_cast<std::size_t>(num_steps_ + 1));
    for (int t = 0; t <= num_steps_; ++t) {
        out[t] = at(t, j);
    }
    return out;
}

PathBundle simulate_paths(const ModelParameters& params, int num_steps, int num_paths,
                          bool antithetic, rng::NormalGenerator& gen) {
    validate(params);
    check_dimensions(num_steps, num_paths);

    const StepParams sp = make_step(params, num_steps);
    PathBundle bundle(num_steps, num_paths);

    generate(num_steps, num_paths, antithetic, gen,
             [&](int col, const std::vector<double>& z, double sign) {
                 bundle.at(0, col) = params.S0;
                 double x = sp.log_S0;
                 for (int t = 0; t < num_steps; ++t) {
                     x += sp.drift + sign * (sp.vol_sdt * z[t]);
                     bundle.at(t + 1, col) = std::exp(x);
                 }
             });
    return bundle;
}

TerminalSample simulate_terminal(const ModelParameters& params, int num_steps, int num_paths,
                                 bool antithetic, rng::NormalGenerator& gen, int keep_paths) {
    validate(params);
    check_dimensions(num_steps, num_paths);

    const StepParams sp = make_step(params, num_steps);
    const int keep = std::clamp(keep_paths, 0, num_paths);

    TerminalSample out;
    out.terminal.resize(static_cast<std::size_t>(num_paths));
    out.sample_paths.resize(static_cast<std::size_t>(keep));

    generate(num_steps, num_paths, antithetic, gen,
             [&](int col, const std::vector<double>& z, double sign) {
                 double x = sp.log_S0;
                 if (col < keep) {
                     auto& path = out.sample_paths[col];
                     path.resize(static_cast<std::size_t>(num_steps + 1));
                     path[0] = params.S0;
                     for (int t = 0; t < num_steps; ++t) {
                         x += sp.drift + sign * (sp.vol_sdt * z[t]);
                         path[t + 1] = std::exp(x);
                     }
                     out.terminal[col] = path[num_steps];
                 } else {
                     for (int t = 0; t < num_steps; ++t) {
                         x += sp.drift + sign * (sp.vol_sdt * z[t]);
                     }
                     out.terminal[col] = std::exp(x);
                 }
             });
    return out;
}

} // namespace mcopt::mc
