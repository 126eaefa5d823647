#include "libmcopt/math/normal.hpp"
#include "libmcopt/core/constants.hpp"

#include <cmath>

namespace mcopt::math {

double norm_pdf(double x) {
    return INV_SQRT_2PI * std::exp(-0.5 * x * x);
}

double norm_cdf(double x) {
    // 0.5 * (1 + erf(x/sqrt2)) rewritten with erfc: no cancellation for x << 0
    return 0.5 * std::erfc(-x / SQRT2);
}

} // namespace mcopt::math
