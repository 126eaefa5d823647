#include "libmcopt/models/black_scholes.hpp"
#include "libmcopt/core/errors.hpp"
#include "libmcopt/math/normal.hpp"

#include <cmath>

namespace mcopt::bs {

namespace {

struct D1D2 {
    double d1;
    double d2;
};

inline D1D2 make_d(const ModelParameters& p) {
    const double vol_sqT = p.sigma * std::sqrt(p.T);
    const double d1 = (std::log(p.S0 / p.K) + (p.r - p.q + 0.5 * p.sigma * p.sigma) * p.T) / vol_sqT;
    return {d1, d1 - vol_sqT};
}

} // namespace

Prices price_analytical(const ModelParameters& params) {
    validate(params);

    const auto [d1, d2] = make_d(params);
    const double fwd_S = params.S0 * std::exp(-params.q * params.T);
    const double disc_K = params.K * std::exp(-params.r * params.T);

    const double call = fwd_S * math::norm_cdf(d1) - disc_K * math::norm_cdf(d2);
    const double put  = disc_K * math::norm_cdf(-d2) - fwd_S * math::norm_cdf(-d1);
    return {call, put};
}

double price(const ModelParameters& params, OptionType type) {
    const Prices p = price_analytical(params);
    switch (type) {
        case OptionType::Call: return p.call;
        case OptionType::Put:  return p.put;
    }
    throw InvalidParameter("option_type", "unrecognized option type value");
}

} // namespace mcopt::bs
