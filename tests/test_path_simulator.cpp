#include <catch2/catch_all.hpp>
#include "libmcopt/core/errors.hpp"
#include "libmcopt/mc/path_simulator.hpp"
#include <cmath>

namespace {

// Counts draws so tests can see how much randomness a call consumed.
class CountingGenerator : public mcopt::rng::NormalGenerator {
public:
    explicit CountingGenerator(std::uint64_t seed) : inner_(seed) {}
    double next() override { ++count; return inner_.next(); }
    void reseed(std::uint64_t seed) override { inner_.reseed(seed); }
    std::size_t count = 0;
private:
    mcopt::rng::Mt64Normal inner_;
};

const mcopt::ModelParameters P{100.0, 95.0, 1.0, 0.05, 0.2, 0.01};

// sigma sqrt(dt) Z recovered from one step of one path
double shock(const mcopt::mc::PathBundle& b, int t, int j, const mcopt::ModelParameters& p) {
    const double dt = p.T / b.num_steps();
    const double drift = (p.r - p.q - 0.5 * p.sigma * p.sigma) * dt;
    return std::log(b.at(t, j) / b.at(t - 1, j)) - drift;
}

} // namespace

TEST_CASE("Path bundle shape and initial row", "[paths]") {
    mcopt::rng::Mt64Normal gen(7);
    const auto b = mcopt::mc::simulate_paths(P, 12, 33, false, gen);
    REQUIRE(b.num_steps() == 12);
    REQUIRE(b.num_paths() == 33);
    REQUIRE(b.data().size() == 13u * 33u);
    for (int j = 0; j < b.num_paths(); ++j) {
        REQUIRE(b.at(0, j) == P.S0);
        REQUIRE(b.path(j).size() == 13u);
    }
    REQUIRE(b.terminal().size() == 33u);
    REQUIRE(b.terminal()[5] == b.at(12, 5));
}

TEST_CASE("Same seed gives the same paths", "[paths]") {
    mcopt::rng::Mt64Normal g1(2024), g2(2024);
    const auto a = mcopt::mc::simulate_paths(P, 10, 50, true, g1);
    const auto b = mcopt::mc::simulate_paths(P, 10, 50, true, g2);
    REQUIRE(a.data() == b.data());
}

TEST_CASE("Antithetic paths mirror the first half at every step", "[paths][antithetic]") {
    const int n = 10, steps = 6;
    CountingGenerator gen(11);
    const auto b = mcopt::mc::simulate_paths(P, steps, n, true, gen);

    REQUIRE(gen.count == static_cast<std::size_t>(n / 2 * steps));
    for (int j = 0; j < n / 2; ++j) {
        for (int t = 1; t <= steps; ++t) {
            const double z = shock(b, t, j, P);
            REQUIRE(shock(b, t, j + n / 2, P) == Catch::Approx(-z).margin(1e-12));
        }
    }
}

TEST_CASE("Odd antithetic count keeps every path and leaves one unpaired", "[paths][antithetic][edge]") {
    const int n = 7, steps = 4;
    CountingGenerator gen(5);
    const auto b = mcopt::mc::simulate_paths(P, steps, n, true, gen);

    // four independent columns, three mirrors
    REQUIRE(b.num_paths() == n);
    REQUIRE(gen.count == static_cast<std::size_t>(4 * steps));
    for (int j = 0; j < 3; ++j) {
        for (int t = 1; t <= steps; ++t) {
            REQUIRE(shock(b, t, 4 + j, P) == Catch::Approx(-shock(b, t, j, P)).margin(1e-12));
        }
    }

    // a single path is just one plain draw
    CountingGenerator one(5);
    const auto single = mcopt::mc::simulate_paths(P, steps, 1, true, one);
    REQUIRE(single.num_paths() == 1);
    REQUIRE(one.count == static_cast<std::size_t>(steps));
}

TEST_CASE("Streaming terminal simulation matches the dense bundle", "[paths]") {
    for (bool antithetic : {false, true}) {
        mcopt::rng::Mt64Normal g1(99), g2(99);
        const auto bundle = mcopt::mc::simulate_paths(P, 8, 41, antithetic, g1);
        const auto sample = mcopt::mc::simulate_terminal(P, 8, 41, antithetic, g2, 20);

        REQUIRE(sample.terminal == bundle.terminal());
        REQUIRE(sample.sample_paths.size() == 20u);
        for (int j = 0; j < 20; ++j) {
            REQUIRE(sample.sample_paths[j] == bundle.path(j));
        }
    }

    mcopt::rng::Mt64Normal g(3);
    const auto few = mcopt::mc::simulate_terminal(P, 3, 5, false, g, 20);
    REQUIRE(few.sample_paths.size() == 5u);
}

TEST_CASE("Terminal prices are a martingale after carry", "[paths]") {
    mcopt::rng::Mt64Normal gen(123);
    const auto sample = mcopt::mc::simulate_terminal(P, 4, 200000, false, gen, 0);
    double sum = 0.0;
    for (double s : sample.terminal) sum += s;
    const double mean = sum / sample.terminal.size();
    const double expected = P.S0 * std::exp((P.r - P.q) * P.T);
    REQUIRE(mean == Catch::Approx(expected).margin(0.25));
}

TEST_CASE("Invalid dimensions fail before any draw", "[paths][edge]") {
    CountingGenerator gen(1);
    REQUIRE_THROWS_AS(mcopt::mc::simulate_paths(P, 0, 10, false, gen), mcopt::InvalidParameter);
    REQUIRE_THROWS_AS(mcopt::mc::simulate_paths(P, 10, -4, true, gen), mcopt::InvalidParameter);
    REQUIRE_THROWS_AS(mcopt::mc::simulate_terminal({100.0, 100.0, 1.0, 0.05, 0.0, 0.0}, 10, 10, false, gen, 0),
                      mcopt::InvalidParameter);
    REQUIRE(gen.count == 0);

    try {
        mcopt::mc::simulate_paths(P, 10, 0, false, gen);
        FAIL("expected InvalidParameter");
    } catch (const mcopt::InvalidParameter& e) {
        REQUIRE(e.parameter() == "numSimulations");
    }
}
