/**
 * @file  fuzz_generator.cpp
 * @brief libFuzzer target for the per-hour generation path
 *
 * Build:
 *   cmake -DADSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_generator
 *
 * Run for 60 seconds:
 *   ./fuzz_generator -max_total_time=60
 *
 * The input bytes are split into a seed, an hour offset and a raw IEEE-754
 * factor (so NaN, ±Inf, subnormals and negatives all reach the generator).
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort.
 *   2. The funnel holds: q25 ≥ q50 ≥ q75 ≥ q100 ≥ 0, clicks ≤ impressions.
 *   3. Every derived rate is finite and in [0, 1].
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "adsim/derived.hpp"
#include "adsim/generator.hpp"
#include "adsim/temporal.hpp"

using namespace adsim;

namespace {

template <typename T>
T take(const uint8_t*& data, size_t& size) {
    T value{};
    const size_t n = size < sizeof(T) ? size : sizeof(T);
    std::memcpy(&value, data, n);
    data += n;
    size -= n;
    return value;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto seed   = take<uint64_t>(data, size);
    const auto offset = take<uint32_t>(data, size);
    const auto factor = take<double>(data, size);

    const HourTs start = std::chrono::sys_seconds{
        std::chrono::sys_days{std::chrono::year{2024} / 1 / 1}};
    const HourTs hour = start + std::chrono::hours{offset % 100000u};

    generator::FunnelGenerator gen;
    RandomStream rng(seed);
    const auto raw = gen.generate_hour(1, hour, factor, rng);

    if (raw.video_q25 < raw.video_q50 || raw.video_q50 < raw.video_q75
        || raw.video_q75 < raw.video_q100 || raw.video_q100 < 0
        || raw.clicks > raw.impressions || raw.impressions < 1) {
        std::abort();
    }

    const auto d = derived::DerivedCalculator::compute(raw);
    if (!derived::DerivedCalculator::rates_bounded(d)) {
        std::abort();
    }

    // The temporal factor itself must be usable for any hour.
    const double f = temporal::TemporalFactorEngine::factor(start, hour, start + std::chrono::hours{size});
    if (!(f > 0.0)) {
        std::abort();
    }
    return 0;
}
