#include "libmcopt/mc/estimator.hpp"
#include "libmcopt/core/errors.hpp"
#include "libmcopt/math/statistics.hpp"

#include <algorithm>
#include <cmath>

namespace mcopt::mc {

namespace {

Estimate discounted(const std::vector<double>& y, double disc) {
    const stats::Moments m = stats::sample_moments(y);
    const double N = static_cast<double>(m.n);
    return {disc * m.mean, disc * std::sqrt(m.variance) / std::sqrt(N)};
}

std::vector<double> payoffs(const std::vector<double>& ST, double K, OptionType type) {
    std::vector<double> y(ST.size());
    std::transform(ST.begin(), ST.end(), y.begin(),
                   [&](double s) { return payoff(s, K, type); });
    return y;
}

// Y - beta (S_T - E[S_T])
std::vector<double> control_adjusted(const std::vector<double>& Y,
                                     const std::vector<double>& ST,
                                     const stats::Moments& st_moments,
                                     double expected_ST) {
    const double mean_Y = stats::sample_moments(Y).mean;
    const double cov = stats::sample_covariance(Y, mean_Y, ST, st_moments.mean);
    // Var(S_T) == 0: the control carries no information, fall back to beta = 0.
    const double beta = st_moments.variance > 0.0 ? cov / st_moments.variance : 0.0;

    std::vector<double> adj(Y.size());
    for (std::size_t i = 0; i < Y.size(); ++i) {
        adj[i] = Y[i] - beta * (ST[i] - expected_ST);
    }
    return adj;
}

void check_terminal(const std::vector<double>& ST) {
    if (ST.empty()) {
        throw InvalidParameter("numSimulations", "no terminal prices to estimate from");
    }
}

} // namespace

double payoff(double ST, double K, OptionType type) {
    switch (type) {
        case OptionType::Call: return std::max(ST - K, 0.0);
        case OptionType::Put:  return std::max(K - ST, 0.0);
    }
    throw InvalidParameter("option_type", "unrecognized option type value");
}

Estimate estimate(const std::vector<double>& ST, const ModelParameters& params,
                  Method method, OptionType type) {
    validate(params);
    check_terminal(ST);

    const double disc = std::exp(-params.r * params.T);
    const std::vector<double> Y = payoffs(ST, params.K, type);

    switch (method) {
        case Method::Standard:
        case Method::Antithetic:
            // antithetic pairing is already baked into ST
            return discounted(Y, disc);
        case Method::ControlVariate: {
            const double expected_ST = params.S0 * std::exp((params.r - params.q) * params.T);
            const stats::Moments st_moments = stats::sample_moments(ST);
            return discounted(control_adjusted(Y, ST, st_moments, expected_ST), disc);
        }
    }
    throw InvalidParameter("method", "unrecognized method value");
}

Estimate estimate(const std::vector<double>& ST, const ModelParameters& params,
                  const std::string& method, OptionType type) {
    return estimate(ST, params, parse_method(method), type);
}

EstimationResult estimate_prices(const std::vector<double>& ST, const ModelParameters& params,
                                 Method method) {
    const Estimate call = estimate(ST, params, method, OptionType::Call);
    const Estimate put = estimate(ST, params, method, OptionType::Put);

    EstimationResult res;
    res.call_price = call.price;
    res.call_std_err = call.std_err;
    res.put_price = put.price;
    res.put_std_err = put.std_err;
    return res;
}

} // namespace mcopt::mc
