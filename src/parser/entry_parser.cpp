/// @file src/parser/entry_parser.cpp
/// @brief EntryParser: directive stripping and kind dispatch.

#include "vitalog/parser.hpp"
#include "vitalog/constants.hpp"
#include "vitalog/directives.hpp"
#include "vitalog/errors.hpp"

#include "field_parsers.hpp"
#include "../util/text.hpp"

#include <stdexcept>

namespace vitalog::parser {

EntryParser::EntryParser(const aliases::AliasResolver& aliases) noexcept
    : aliases_(aliases)
{}

std::optional<EntryKind> EntryParser::kind_for_keyword(std::string_view token) noexcept {
    if (token == "hr")                        return EntryKind::HeartRate;
    if (token == "hrv")                       return EntryKind::Hrv;
    if (token == "temp")                      return EntryKind::Temperature;
    if (token == "weight" || token == "bw")   return EntryKind::Bodyweight;
    if (token == "cp" || token == "pause")    return EntryKind::ControlPause;
    return std::nullopt;
}

entry::ParsedEntry EntryParser::parse(std::string_view text) const {
    return parse(text, local_now());
}

entry::ParsedEntry EntryParser::parse(std::string_view text, Timestamp now) const {
    // Names and tags are copied into the export form, which must be valid JSON.
    if (!util::is_valid_utf8(text)) {
        throw std::invalid_argument("Entry text is not valid UTF-8");
    }

    // One snapshot for the whole call: a concurrent reload cannot change
    // the tables halfway through.
    const auto table = aliases_.snapshot();

    auto directives = directives::extract(text, now,
                                          table->category(constants::ALIAS_TAGS));

    const auto tokens = util::split_whitespace(directives.remainder);
    if (tokens.empty()) {
        throw EmptyInputError();
    }

    const detail::FieldContext ctx{
        .timestamp = directives.timestamp,
        .tags      = std::move(directives.tags),
        .table     = *table,
    };

    const auto kind = kind_for_keyword(tokens.front());
    if (!kind) {
        return detail::parse_exercise(tokens, ctx);
    }

    const std::span<const std::string> fields = std::span(tokens).subspan(1);
    switch (*kind) {
        case EntryKind::HeartRate:    return detail::parse_heart_rate(fields, ctx);
        case EntryKind::Hrv:          return detail::parse_hrv(fields, ctx);
        case EntryKind::Temperature:  return detail::parse_temperature(fields, ctx);
        case EntryKind::Bodyweight:   return detail::parse_bodyweight(fields, ctx);
        case EntryKind::ControlPause: return detail::parse_control_pause(fields, ctx);
        case EntryKind::Exercise:     break;
    }
    return detail::parse_exercise(tokens, ctx);
}

} // namespace vitalog::parser
