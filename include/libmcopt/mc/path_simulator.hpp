#pragma once

#include "libmcopt/core/types.hpp"
#include "libmcopt/rng/normal_generator.hpp"

#include <cstddef>
#include <vector>

namespace mcopt::mc {

// Simulated prices, (num_steps + 1) rows by num_paths columns, row-major.
// Row 0 holds S0 for every path.
class PathBundle {
public:
    PathBundle(int num_steps, int num_paths);

    int num_steps() const { return num_steps_; }
    int num_paths() const { return num_paths_; }

    double& at(int step, int path) { return data_[index(step, path)]; }
    double at(int step, int path) const { return data_[index(step, path)]; }

    // Last row.
    std::vector<double> terminal() const;
    // One column, step 0..num_steps.
    std::vector<double> path(int j) const;

    const std::vector<double>& data() const { return data_; }

private:
    std::size_t index(int step, int path) const {
        return static_cast<std::size_t>(step) * static_cast<std::size_t>(num_paths_) +
               static_cast<std::size_t>(path);
    }

    int num_steps_;
    int num_paths_;
    std::vector<double> data_;
};

struct TerminalSample {
    std::vector<double> terminal;                   // S_T per path
    std::vector<std::vector<double>> sample_paths;  // first keep_paths paths, num_steps + 1 each
};

// Risk-neutral GBM, dt = T / num_steps, log increments
// (r - q - sigma^2/2) dt + sigma sqrt(dt) Z accumulated from ln S0.
//
// Antithetic: the first ceil(n/2) columns get independent draws; column
// ceil(n/2) + j replays column j with every Z negated, for j < floor(n/2).
// With odd n the last independent column is left unpaired, so the bundle
// always holds exactly n paths.
//
// Draws are consumed path by path, so simulate_paths and simulate_terminal
// produce the same terminal prices from the same generator state.
PathBundle simulate_paths(const ModelParameters& params, int num_steps, int num_paths,
                          bool antithetic, rng::NormalGenerator& gen);

// Same process without the dense matrix: terminal prices plus the first
// keep_paths full paths.
TerminalSample simulate_terminal(const ModelParameters& params, int num_steps, int num_paths,
                                 bool antithetic, rng::NormalGenerator& gen, int keep_paths);

} // namespace mcopt::mc
