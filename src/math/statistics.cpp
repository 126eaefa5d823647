#include "libmcopt/math/statistics.hpp"
#include "libmcopt/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace mcopt::stats {

Moments sample_moments(const std::vector<double>& x) {
    Moments m;
    m.n = x.size();
    if (m.n == 0) {
        return m;
    }

    double sum = 0.0;
    for (double v : x) sum += v;
    m.mean = sum / static_cast<double>(m.n);

    if (m.n < 2) {
        return m;
    }

    // Centered sums plus the compensation term for rounding in the mean.
    double ss = 0.0;
    double comp = 0.0;
    for (double v : x) {
        const double d = v - m.mean;
        ss += d * d;
        comp += d;
    }
    const double N = static_cast<double>(m.n);
    m.variance = std::max(0.0, (ss - comp * comp / N) / (N - 1.0));
    return m;
}

double sample_covariance(const std::vector<double>& x, double mean_x,
                         const std::vector<double>& y, double mean_y) {
    if (x.size() != y.size()) {
        throw InvalidParameter("y", "covariance series lengths differ");
    }
    const std::size_t n = x.size();
    if (n < 2) {
        return 0.0;
    }
    double s = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        s += (x[i] - mean_x) * (y[i] - mean_y);
    }
    return s / (static_cast<double>(n) - 1.0);
}

double historical_volatility(const std::vector<double>& closes, double periods_per_year) {
    if (!(periods_per_year > 0.0) || !std::isfinite(periods_per_year)) {
        throw InvalidParameter("periods_per_year", "must be positive and finite");
    }
    if (closes.size() < 2) {
        throw InvalidParameter("closes", "need at least two prices");
    }

    std::vector<double> log_returns;
    log_returns.reserve(closes.size() - 1);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        if (!(closes[i] > 0.0) || !(closes[i - 1] > 0.0)) {
            throw InvalidParameter("closes", "prices must be positive, index " + std::to_string(i));
        }
        log_returns.push_back(std::log(closes[i] / closes[i - 1]));
    }

    const Moments m = sample_moments(log_returns);
    // population variance
    const double N = static_cast<double>(m.n);
    const double pop_var = m.n < 2 ? 0.0 : m.variance * (N - 1.0) / N;
    return std::sqrt(pop_var * periods_per_year);
}

} // namespace mcopt::stats
