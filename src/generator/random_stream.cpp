/// @file src/generator/random_stream.cpp
/// @brief RandomStream — portable uniform draws over std::mt19937_64.

#include "adsim/random_stream.hpp"

#include <bit>

namespace adsim {

namespace {

[[nodiscard]] RandomStream::Seed entropy_seed() {
    std::random_device rd;
    const auto hi = static_cast<std::uint64_t>(rd());
    const auto lo = static_cast<std::uint64_t>(rd());
    return (hi << 32) ^ lo;
}

}  // namespace

RandomStream::RandomStream(Seed seed) noexcept
    : seed_(seed)
    , engine_(seed)
{}

RandomStream::RandomStream(std::optional<Seed> seed)
    : RandomStream(seed ? *seed : entropy_seed())
{}

std::uint64_t RandomStream::next() noexcept {
    ++draws_;
    return engine_();
}

double RandomStream::uniform(double a, double b) noexcept {
    if (!(b > a)) {
        return a;
    }
    // 53 high bits → [0, 1) with full double precision.
    constexpr double kInv53 = 1.0 / 9007199254740992.0;  // 2^-53
    const double u = static_cast<double>(next() >> 11) * kInv53;
    return a + (b - a) * u;
}

std::int64_t RandomStream::uniform_int(std::int64_t lo, std::int64_t hi) noexcept {
    if (hi <= lo) {
        return lo;
    }
    const auto range = static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo);
    if (range == ~std::uint64_t{0}) {
        return static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) + next());
    }

    // Smallest all-ones mask covering `range`; reject draws above it.
    const std::uint64_t mask = (range == 0)
        ? 0
        : (~std::uint64_t{0} >> std::countl_zero(range));
    std::uint64_t r = 0;
    do {
        r = next() & mask;
    } while (r > range);

    return static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) + r);
}

}  // namespace adsim
