#pragma once

#include <cstddef>
#include <vector>

namespace mcopt::stats {

struct Moments {
    double mean = 0.0;
    double variance = 0.0;  // sample variance, n-1 denominator (0 when n < 2)
    std::size_t n = 0;
};

// Two-pass mean/variance.
Moments sample_moments(const std::vector<double>& x);

// Sample covariance (n-1 denominator) of two equal-length series.
double sample_covariance(const std::vector<double>& x, double mean_x,
                         const std::vector<double>& y, double mean_y);

// Annualized volatility of log returns of a close series:
// population std dev of ln(c[i]/c[i-1]) times sqrt(periods_per_year).
double historical_volatility(const std::vector<double>& closes, double periods_per_year = 252.0);

} // namespace mcopt::stats
