/**
 * @file  fuzz_data_loader.cpp
 * @brief libFuzzer target for the CSV snapshot parsers
 *
 * Build:
 *   cmake -DPFV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_data_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_data_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse_chain:
 *      a. every expiration holds at least one contract
 *      b. total_call_oi / total_put_oi equal the sum of the parsed rows
 *      c. every parsed strike and open interest is finite
 *   3. parse_technical: a returned snapshot has a finite current_price.
 *   4. parse_date: a returned date is a valid calendar date.
 *
 * Fuzzer strategy:
 *   The same bytes are fed to all three parsers.  They must handle binary
 *   garbage, missing headers, CRLF line endings, "nan" / "inf" cells, and
 *   rows with too few columns.
 */

#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "pfv/data_loader.hpp"

using namespace pfv;
using namespace pfv::core;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string input{reinterpret_cast<const char*>(data), size};

    for (const auto& exp : DataLoader::parse_chain(input)) {
        // Invariant 2a
        assert(!exp.calls.empty() || !exp.puts.empty());

        double call_oi = 0.0;
        for (const auto& c : exp.calls) {
            // Invariant 2c
            assert(std::isfinite(c.strike));
            assert(std::isfinite(c.open_interest));
            call_oi += c.open_interest;
        }
        double put_oi = 0.0;
        for (const auto& p : exp.puts) {
            assert(std::isfinite(p.strike));
            assert(std::isfinite(p.open_interest));
            put_oi += p.open_interest;
        }
        // Invariant 2b
        assert(exp.total_call_oi == call_oi);
        assert(exp.total_put_oi == put_oi);
    }

    if (const auto t = DataLoader::parse_technical(input)) {
        // Invariant 3
        assert(std::isfinite(t->current_price));
    }

    if (const auto d = DataLoader::parse_date(std::string_view{input})) {
        // Invariant 4
        assert(d->ok());
    }

    return 0;
}
