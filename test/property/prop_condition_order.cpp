/**
 * @file  prop_condition_order.cpp
 * @brief Property: ConditionResolver::resolve depends only on the set of
 *        condition values, never on token order.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_condition_order
 *
 * For a kind K and a set S holding at most one value per dimension that
 * applies to K:
 *   resolve(π₁(S), K) == resolve(π₂(S), K)   for any permutations π₁, π₂
 *   the output lists values in strictly ascending dimension priority
 *   interleaving non-condition tokens does not change the output
 *
 * Failure modes this test guards against:
 *   • Output built in input order instead of priority order
 *   • Noise tokens mistaken for conditions
 *   • Alias resolution applied after the priority sort
 */

#include <rapidcheck.h>

#include "vitalog/conditions.hpp"

#include <algorithm>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <vector>

using namespace vitalog;
using namespace vitalog::conditions;

namespace {

const aliases::CategoryMap NO_ALIASES;

/// One random value from each of a random subset of the dimensions of `kind`.
std::vector<std::string> gen_condition_set(EntryKind kind) {
    std::vector<std::string> values;
    for (const auto& dim : applicable_dimensions(kind)) {
        if (*rc::gen::arbitrary<bool>()) {
            const std::vector<std::string> choices(dim.values.begin(), dim.values.end());
            values.push_back(*rc::gen::elementOf(choices));
        }
    }
    return values;
}

EntryKind gen_condition_kind() {
    return *rc::gen::element(EntryKind::HeartRate, EntryKind::Hrv,
                             EntryKind::Temperature, EntryKind::ControlPause);
}

std::vector<std::string> shuffled(std::vector<std::string> tokens) {
    std::mt19937 rng(*rc::gen::arbitrary<std::uint32_t>());
    std::shuffle(tokens.begin(), tokens.end(), rng);
    return tokens;
}

std::vector<int> priorities_of(const std::string& conditions) {
    std::vector<int> out;
    std::istringstream stream(conditions);
    std::string value;
    while (std::getline(stream, value, ',')) {
        const Dimension* dim = dimension_of(value);
        out.push_back(dim == nullptr ? -1 : dim->priority);
    }
    return out;
}

} // anonymous namespace

int main() {
    bool ok = true;

    // ── Property 1: any two permutations resolve identically ───────────────
    ok = rc::check(
        "condition_order: resolve is permutation-invariant",
        []() {
            const EntryKind kind = gen_condition_kind();
            const auto values = gen_condition_set(kind);

            const auto a = ConditionResolver::resolve(shuffled(values), kind, NO_ALIASES);
            const auto b = ConditionResolver::resolve(shuffled(values), kind, NO_ALIASES);
            RC_ASSERT(a == b);
            RC_ASSERT(a.has_value() == !values.empty());
        }
    ) && ok;

    // ── Property 2: output is in strictly ascending priority ───────────────
    ok = rc::check(
        "condition_order: output sorted by dimension priority",
        []() {
            const EntryKind kind = gen_condition_kind();
            const auto values = gen_condition_set(kind);
            RC_PRE(!values.empty());

            const auto resolved = ConditionResolver::resolve(shuffled(values), kind, NO_ALIASES);
            RC_ASSERT(resolved.has_value());

            const auto priorities = priorities_of(*resolved);
            RC_ASSERT(priorities.size() == values.size());
            RC_ASSERT(std::is_sorted(priorities.begin(), priorities.end()));
            RC_ASSERT(std::adjacent_find(priorities.begin(), priorities.end()) ==
                      priorities.end());
            RC_ASSERT(priorities.front() > 0);
        }
    ) && ok;

    // ── Property 3: noise tokens are invisible ─────────────────────────────
    ok = rc::check(
        "condition_order: non-condition tokens do not affect the result",
        []() {
            const EntryKind kind = gen_condition_kind();
            const auto values = gen_condition_set(kind);
            const std::vector<std::string> noise_pool = {
                "banana", "42", "sdnn", "after", "coffee", "3x5", "rest-day",
            };
            const auto noise = *rc::gen::container<std::vector<std::string>>(
                rc::gen::elementOf(noise_pool));

            std::vector<std::string> mixed = values;
            mixed.insert(mixed.end(), noise.begin(), noise.end());

            RC_ASSERT(ConditionResolver::resolve(shuffled(mixed), kind, NO_ALIASES) ==
                      ConditionResolver::resolve(values, kind, NO_ALIASES));
        }
    ) && ok;

    // ── Property 4: aliased and canonical spellings agree ──────────────────
    ok = rc::check(
        "condition_order: alias resolution happens before ordering",
        []() {
            const EntryKind kind = gen_condition_kind();
            const auto values = gen_condition_set(kind);

            // Alias every value as "a<i>".
            aliases::CategoryMap alias_map;
            std::vector<std::string> aliased;
            for (std::size_t i = 0; i < values.size(); ++i) {
                const std::string abbreviation = "a" + std::to_string(i);
                alias_map[abbreviation] = values[i];
                aliased.push_back(abbreviation);
            }

            RC_ASSERT(ConditionResolver::resolve(shuffled(aliased), kind, alias_map) ==
                      ConditionResolver::resolve(values, kind, NO_ALIASES));
        }
    ) && ok;

    return ok ? 0 : 1;
}
