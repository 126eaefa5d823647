#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

namespace mcopt::rng {

// Source of independent standard normal draws. Implementations are not
// thread-safe; give each simulation its own instance.
class NormalGenerator {
public:
    virtual ~NormalGenerator() = default;

    virtual double next() = 0;

    virtual void fill(double* out, std::size_t n) {
        for (std::size_t i = 0; i < n; ++i) out[i] = next();
    }

    virtual void reseed(std::uint64_t seed) = 0;
};

// mt19937_64 + std::normal_distribution
class Mt64Normal final : public NormalGenerator {
public:
    explicit Mt64Normal(std::uint64_t seed) : engine_(seed) {}

    double next() override { return dist_(engine_); }

    void reseed(std::uint64_t seed) override {
        engine_.seed(seed);
        dist_.reset();
    }

private:
    std::mt19937_64 engine_;
    std::normal_distribution<double> dist_{0.0, 1.0};
};

// Seeded from std::random_device.
std::unique_ptr<NormalGenerator> make_generator();

std::unique_ptr<NormalGenerator> make_generator(std::uint64_t seed);

} // namespace mcopt::rng
