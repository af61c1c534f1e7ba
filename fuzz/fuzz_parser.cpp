/**
 * @file  fuzz_parser.cpp
 * @brief libFuzzer target for EntryParser::parse (end-to-end)
 *
 * Build:
 *   cmake -DVITALOG_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. The only exception that escapes parse() is std::invalid_argument.
 *   3. If an entry is returned:
 *      a. display() is non-empty
 *      b. tags, when present, are non-empty and duplicate-free
 *      c. conditions, when present, re-validate for the entry kind
 *      d. exercise reps are non-empty and positive; RPE within [1, 10]
 *      e. control-pause seconds within (0, 600)
 *      f. to_json(e).dump() succeeds, and from_json(to_json(e)) renders the
 *         same display string
 */

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

#include "vitalog/conditions.hpp"
#include "vitalog/constants.hpp"
#include "vitalog/entry.hpp"
#include "vitalog/parser.hpp"

using namespace vitalog;

namespace {

const aliases::AliasResolver& resolver() {
    static const aliases::AliasResolver instance(aliases::AliasMap{
        {"exercises",  {{"sq", "squat"}}},
        {"conditions", {{"rest", "resting"}, {"pp", "postprandial"}, {"mouth", "oral"}}},
        {"tags",       {{"fitbit", "oura"}}},
    });
    return instance;
}

const Timestamp NOW = make_timestamp(2026, 1, 15, 9, 0, 0);

} // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const parser::EntryParser parser(resolver());

    entry::ParsedEntry result;
    try {
        result = parser.parse(input, NOW);
    } catch (const std::invalid_argument&) {
        return 0;  // Invariant 2: rejected input
    }

    // Invariant 3a
    const std::string shown = entry::display(result);
    assert(!shown.empty());

    // Invariant 3b
    if (const auto& tags = entry::tags_of(result)) {
        assert(!tags->empty());
        const std::set<std::string> unique(tags->begin(), tags->end());
        assert(unique.size() == tags->size());
    }

    // Invariant 3c
    conditions::ConditionResolver::validate(entry::conditions_of(result),
                                            entry::kind_of(result));

    // Invariants 3d, 3e
    if (const auto* e = std::get_if<entry::Exercise>(&result)) {
        assert(!e->reps.empty());
        assert(std::all_of(e->reps.begin(), e->reps.end(), [](int r) { return r > 0; }));
        if (e->rpe) {
            assert(*e->rpe >= constants::RPE_MIN && *e->rpe <= constants::RPE_MAX);
        }
    }
    if (const auto* cp = std::get_if<entry::ControlPause>(&result)) {
        assert(cp->seconds > 0 && cp->seconds < constants::CONTROL_PAUSE_LIMIT);
    }

    // Invariant 3f
    const auto exported = entry::to_json(result);
    const std::string serialized = exported.dump();
    assert(!serialized.empty());
    const auto restored = entry::from_json(nlohmann::json::parse(serialized));
    assert(entry::display(restored) == shown);

    return 0;
}
