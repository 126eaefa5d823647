#pragma once

namespace mcopt {

constexpr double SQRT2 = 1.41421356237309504880;
constexpr double INV_SQRT_2PI = 0.39894228040143267794;

// Simulation defaults
constexpr int DEFAULT_NUM_SIMULATIONS = 10000;
constexpr int DEFAULT_NUM_STEPS = 252;
constexpr int PATH_SUBSAMPLE = 20;

// Convergence ladder
constexpr int LADDER_MIN_SIMULATIONS = 100;
constexpr int LADDER_MAX_SIMULATIONS = 10000;
constexpr int LADDER_POINTS = 20;
constexpr int LADDER_NUM_STEPS = 100;

constexpr double TRADING_DAYS_PER_YEAR = 252.0;

} // namespace mcopt
