#pragma once

namespace mcopt::math {

// Standard normal density.
double norm_pdf(double x);

// Standard normal CDF, saturating to 0/1 in the tails.
double norm_cdf(double x);

} // namespace mcopt::math
