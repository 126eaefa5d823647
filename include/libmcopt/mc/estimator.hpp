#pragma once

#include "libmcopt/core/types.hpp"

#include <string>
#include <vector>

namespace mcopt::mc {

struct Estimate {
    double price;    // discounted
    double std_err;  // discounted
};

struct EstimationResult {
    double call_price = 0.0;
    double call_std_err = 0.0;
    double put_price = 0.0;
    double put_std_err = 0.0;
    std::vector<std::vector<double>> paths;  // first min(20, n) paths, num_steps + 1 each
    std::vector<int> steps;                  // 0..num_steps
};

double payoff(double ST, double K, OptionType type);

// Discounted payoff mean and standard error from terminal prices.
//   Standard / Antithetic: plain sample mean of the payoffs.
//   ControlVariate: payoff - beta (S_T - S0 e^{(r-q)T}),
//                   beta = Cov(payoff, S_T) / Var(S_T), 0 when Var(S_T) == 0.
Estimate estimate(const std::vector<double>& ST, const ModelParameters& params,
                  Method method, OptionType type);

Estimate estimate(const std::vector<double>& ST, const ModelParameters& params,
                  const std::string& method, OptionType type);

// Call and put from the same terminal prices. paths/steps are left empty.
EstimationResult estimate_prices(const std::vector<double>& ST, const ModelParameters& params,
                                 Method method);

} // namespace mcopt::mc
