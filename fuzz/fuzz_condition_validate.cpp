/**
 * @file  fuzz_condition_validate.cpp
 * @brief libFuzzer target for ConditionResolver::validate and resolve
 *
 * Build:
 *   cmake -DVITALOG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_condition_validate
 *
 * Safety invariants verified on every input:
 *   1. No crash for any byte sequence.
 *   2. validate() either accepts or throws a ParseError subtype.
 *   3. A string that validates also resolves: its comma-separated parts
 *      are all applicable to the kind and never conflict.
 *
 * Input layout:
 *   byte 0       → entry kind (mod 6)
 *   bytes 1..N   → candidate condition string
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "vitalog/conditions.hpp"
#include "vitalog/errors.hpp"

using namespace vitalog;
using namespace vitalog::conditions;

namespace {

constexpr EntryKind KINDS[] = {
    EntryKind::Exercise, EntryKind::HeartRate, EntryKind::Hrv,
    EntryKind::Temperature, EntryKind::Bodyweight, EntryKind::ControlPause,
};

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) {
        return 0;
    }

    const EntryKind kind = KINDS[data[0] % std::size(KINDS)];
    const std::string candidate(reinterpret_cast<const char*>(data + 1), size - 1);

    try {
        ConditionResolver::validate(candidate, kind);
    } catch (const ParseError&) {
        return 0;  // Invariant 2
    }

    // Invariant 3
    std::vector<std::string> parts;
    std::istringstream stream(candidate);
    std::string part;
    while (std::getline(stream, part, ',')) {
        parts.push_back(part);
    }

    const auto resolved = ConditionResolver::resolve(parts, kind, aliases::CategoryMap{});
    assert(resolved.has_value());
    (void)resolved;

    return 0;
}
