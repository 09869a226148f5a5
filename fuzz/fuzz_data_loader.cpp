/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for DataLoader::parse_csv_string
 *
 * Build:
 *   cmake -DCMF_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. If a series is returned:
 *      a. every price is finite
 *      b. timestamps / volume are either empty or the same length as prices
 *      c. every volume is finite and non-negative
 *
 * Fuzzer strategy:
 *   Input is passed directly as the CSV text. The parser must handle
 *   binary garbage, missing header, quoted fields, CR/LF mixes,
 *   "nan"/"inf" tokens and out-of-range exponents.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string>

#include "cmf/data_loader.hpp"

using namespace cmf;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto series = DataLoader::parse_csv_string(input);
    if (!series.has_value()) {
        return 0;
    }

    // Invariant 2a
    for (double p : series->prices) {
        assert(std::isfinite(p));
    }

    // Invariant 2b
    assert(series->timestamps.empty() || series->timestamps.size() == series->size());
    assert(series->volume.empty() || series->volume.size() == series->size());

    // Invariant 2c
    for (double v : series->volume) {
        assert(std::isfinite(v));
        assert(v >= 0.0);
    }

    return 0;
}
