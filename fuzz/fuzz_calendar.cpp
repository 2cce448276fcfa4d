/**
 * @file  fuzz_calendar.cpp
 * @brief libFuzzer target for the date / timestamp parsers used by the store
 *
 * Build:
 *   cmake -DADSIM_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_calendar
 *
 * Safety invariants verified on every input:
 *   1. No crash, no out-of-bounds read for any byte sequence.
 *   2. Anything parse_date accepts formats back to the same text.
 *   3. Anything parse_timestamp accepts formats back to the same text.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include "adsim/temporal.hpp"

using namespace adsim::temporal;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    if (const auto d = parse_date(input)) {
        if (format_date(*d) != input) {
            std::abort();
        }
    }

    if (const auto ts = parse_timestamp(input)) {
        if (format_timestamp(*ts) != input) {
            std::abort();
        }
    }
    return 0;
}
