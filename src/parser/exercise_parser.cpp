/// @file src/parser/exercise_parser.cpp
/// @brief Exercise field disambiguation: weight vs reps vs RPE.
///
/// A single left-to-right scan fills three slots. The only ambiguous token
/// is a bare number before anything is filled, which may be a weight
/// (`squat 100 3x5`) or the reps themselves (`pushups 10`). One token of
/// lookahead decides:
///
///   next token is a reps pattern → this one is the weight
///   else this one is a reps pattern → it is the reps
///   else                           → it is the weight (`squat 42.5kg ...`)
///
/// so a lone trailing number is reps, and `pushups 10 8` is 10 kg × [8].
/// RPE is only looked for once reps are filled, so `pushups 8` is never read
/// as an RPE.

#include "field_parsers.hpp"

#include "vitalog/constants.hpp"
#include "vitalog/errors.hpp"

namespace vitalog::parser::detail {

entry::Exercise parse_exercise(std::span<const std::string> tokens, const FieldContext& ctx) {
    if (tokens.empty()) {
        throw EmptyInputError();
    }

    std::string name = ctx.table.resolve(constants::ALIAS_EXERCISES, tokens.front());
    const auto rest = tokens.subspan(1);

    std::optional<double>           weight;
    std::optional<std::vector<int>> reps;
    std::optional<double>           rpe;

    for (std::size_t i = 0; i < rest.size(); ++i) {
        const std::string& token = rest[i];

        if (!weight && !reps) {
            if (const auto candidate = match_weight(token)) {
                const bool next_is_reps = i + 1 < rest.size() && is_reps_pattern(rest[i + 1]);
                if (!next_is_reps && is_reps_pattern(token)) {
                    reps = parse_reps(token);
                } else {
                    weight = *candidate;
                }
                continue;
            }
        }

        if (!reps && is_reps_pattern(token)) {
            reps = parse_reps(token);
            continue;
        }

        if (reps && !rpe) {
            if (const auto value = match_rpe(token)) {
                rpe = *value;
                continue;
            }
        }

        // Anything else (out-of-range RPE, stray words) is ignored.
    }

    if (!reps) {
        throw RepsParseError();
    }

    // A zero load is bodyweight work.
    if (weight && *weight == 0.0) {
        weight.reset();
    }

    return entry::Exercise{
        .name      = std::move(name),
        .weight_kg = weight,
        .reps      = std::move(*reps),
        .rpe       = rpe,
        .timestamp = ctx.timestamp,
        .tags      = ctx.tags,
    };
}

} // namespace vitalog::parser::detail
