#include <catch2/catch_all.hpp>
#include "libmcopt/core/errors.hpp"
#include "libmcopt/math/statistics.hpp"
#include <cmath>

using Catch::Approx;

TEST_CASE("Sample moments use the n-1 denominator", "[stats]") {
    const auto m = mcopt::stats::sample_moments({0.0, 0.0, 10.0, 20.0});
    REQUIRE(m.n == 4);
    REQUIRE(m.mean == Approx(7.5));
    REQUIRE(m.variance == Approx(275.0 / 3.0));

    const auto one = mcopt::stats::sample_moments({3.0});
    REQUIRE(one.mean == 3.0);
    REQUIRE(one.variance == 0.0);
}

TEST_CASE("Sample moments stay exact for large offsets", "[stats][edge]") {
    const double base = 1e9;
    const auto m = mcopt::stats::sample_moments({base + 4.0, base + 7.0, base + 13.0, base + 16.0});
    REQUIRE(m.variance == Approx(30.0).epsilon(1e-9));

    const auto flat = mcopt::stats::sample_moments({105.0, 105.0, 105.0});
    REQUIRE(flat.variance == 0.0);
}

TEST_CASE("Sample covariance", "[stats]") {
    const std::vector<double> x{1.0, 2.0, 3.0, 4.0};
    const std::vector<double> y{2.0, 4.0, 6.0, 8.0};
    REQUIRE(mcopt::stats::sample_covariance(x, 2.5, y, 5.0) == Approx(2.0 * 5.0 / 3.0));
    REQUIRE_THROWS_AS(mcopt::stats::sample_covariance(x, 2.5, {1.0}, 1.0), mcopt::InvalidParameter);
}

TEST_CASE("Historical volatility annualizes log-return dispersion", "[stats]") {
    const std::vector<double> closes{100.0, 110.0, 99.0};
    const double r1 = std::log(110.0 / 100.0);
    const double r2 = std::log(99.0 / 110.0);
    // population std dev of two points is half their distance
    const double expected = 0.5 * std::abs(r1 - r2) * std::sqrt(252.0);
    REQUIRE(mcopt::stats::historical_volatility(closes) == Approx(expected).epsilon(1e-12));

    std::vector<double> growth;
    for (int i = 0; i < 30; ++i) growth.push_back(100.0 * std::pow(1.01, i));
    REQUIRE(mcopt::stats::historical_volatility(growth) == Approx(0.0).margin(1e-10));
}

TEST_CASE("Historical volatility rejects unusable series", "[stats][edge]") {
    REQUIRE_THROWS_AS(mcopt::stats::historical_volatility({100.0}), mcopt::InvalidParameter);
    REQUIRE_THROWS_AS(mcopt::stats::historical_volatility({100.0, -5.0, 100.0}), mcopt::InvalidParameter);
    REQUIRE_THROWS_AS(mcopt::stats::historical_volatility({100.0, 101.0}, 0.0), mcopt::InvalidParameter);
}
