#pragma once

#include "libmcopt/core/types.hpp"

namespace mcopt::bs {

struct Prices {
    double call;
    double put;
};

// Dividend-adjusted Black-Scholes. Throws InvalidParameter for non-positive
// S0, K, T or sigma.
Prices price_analytical(const ModelParameters& params);

double price(const ModelParameters& params, OptionType type);

} // namespace mcopt::bs
