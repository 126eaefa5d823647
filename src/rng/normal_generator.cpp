#include "libmcopt/rng/normal_generator.hpp"

namespace mcopt::rng {

std::unique_ptr<NormalGenerator> make_generator() {
    std::random_device rd;
    const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
    return std::make_unique<Mt64Normal>(seed);
}

std::unique_ptr<NormalGenerator> make_generator(std::uint64_t seed) {
    return std::make_unique<Mt64Normal>(seed);
}

} // namespace mcopt::rng
