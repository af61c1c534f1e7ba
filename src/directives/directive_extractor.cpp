/// @file src/directives/directive_extractor.cpp
/// @brief Timestamp and tag directive scanning.

#include "vitalog/directives.hpp"

#include "../util/text.hpp"

#include <algorithm>
#include <charconv>
#include <optional>
#include <vector>

namespace vitalog::directives {

namespace {

constexpr std::string_view YESTERDAY = "yesterday";

/// A directive located in the text: [start, start + length).
struct Match {
    std::size_t start;
    std::size_t length;
};

bool digits_at(std::string_view text, std::size_t pos, std::size_t count) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    return util::all_digits(text.substr(pos, count));
}

int read_int(std::string_view digits) noexcept {
    int value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

/// `@H:MM` or `@HH:MM`. Two hour digits are preferred over one.
std::optional<Match> find_time(std::string_view text) noexcept {
    for (std::size_t at = text.find('@'); at != std::string_view::npos;
         at = text.find('@', at + 1)) {
        for (std::size_t hour_digits : {2u, 1u}) {
            const std::size_t colon = at + 1 + hour_digits;
            if (digits_at(text, at + 1, hour_digits) &&
                colon < text.size() && text[colon] == ':' &&
                digits_at(text, colon + 1, 2)) {
                return Match{at, hour_digits + 4};
            }
        }
    }
    return std::nullopt;
}

std::optional<Match> find_yesterday(std::string_view text) noexcept {
    const std::size_t at = text.find("@yesterday");
    if (at == std::string_view::npos) {
        return std::nullopt;
    }
    return Match{at, YESTERDAY.size() + 1};
}

/// `@YYYY-MM-DD`.
std::optional<Match> find_date(std::string_view text) noexcept {
    for (std::size_t at = text.find('@'); at != std::string_view::npos;
         at = text.find('@', at + 1)) {
        if (digits_at(text, at + 1, 4) &&
            at + 5 < text.size() && text[at + 5] == '-' &&
            digits_at(text, at + 6, 2) &&
            at + 8 < text.size() && text[at + 8] == '-' &&
            digits_at(text, at + 9, 2)) {
            return Match{at, 11};
        }
    }
    return std::nullopt;
}

std::string without(std::string_view text, const Match& m) {
    std::string out(text.substr(0, m.start));
    out += text.substr(m.start + m.length);
    return std::string(util::trim(out));
}

bool is_tag_char(char c) noexcept {
    return util::is_alpha(c) || util::is_digit(c) || c == '-' || c == '_';
}

} // anonymous namespace

// ─── extract_timestamp ────────────────────────────────────────────────────────

TimestampExtraction extract_timestamp(std::string_view text, Timestamp reference) {
    using namespace std::chrono;

    const auto midnight = floor<days>(reference);

    if (const auto m = find_time(text)) {
        const std::string_view directive = text.substr(m->start + 1, m->length - 1);
        const std::size_t colon = directive.find(':');
        const int hour   = read_int(directive.substr(0, colon));
        const int minute = read_int(directive.substr(colon + 1));

        const year_month_day ymd{midnight};
        const Timestamp ts = make_timestamp(static_cast<int>(ymd.year()),
                                            static_cast<unsigned>(ymd.month()),
                                            static_cast<unsigned>(ymd.day()),
                                            hour, minute, 0);
        return TimestampExtraction{.timestamp = ts, .text = without(text, *m), .matched = true};
    }

    if (const auto m = find_yesterday(text)) {
        return TimestampExtraction{
            .timestamp = midnight - days{1},
            .text      = without(text, *m),
            .matched   = true,
        };
    }

    if (const auto m = find_date(text)) {
        const std::string_view directive = text.substr(m->start + 1, m->length - 1);
        const Timestamp ts = make_timestamp(read_int(directive.substr(0, 4)),
                                            static_cast<unsigned>(read_int(directive.substr(5, 2))),
                                            static_cast<unsigned>(read_int(directive.substr(8, 2))));
        return TimestampExtraction{.timestamp = ts, .text = without(text, *m), .matched = true};
    }

    return TimestampExtraction{
        .timestamp = reference,
        .text      = std::string(text),
        .matched   = false,
    };
}

// ─── extract_tags ─────────────────────────────────────────────────────────────

TagExtraction extract_tags(std::string_view text, const aliases::CategoryMap& tag_aliases) {
    std::vector<std::string> tags;
    std::string stripped;
    stripped.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '@' || i + 1 >= text.size() || !util::is_alpha(text[i + 1])) {
            stripped += text[i++];
            continue;
        }

        std::size_t end = i + 1;
        while (end < text.size() && is_tag_char(text[end])) ++end;

        const std::string word = util::to_lower(text.substr(i + 1, end - i - 1));
        if (word == YESTERDAY) {
            stripped.append(text.substr(i, end - i));
            i = end;
            continue;
        }

        const auto alias = tag_aliases.find(word);
        std::string tag = alias == tag_aliases.end() ? word : alias->second;
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
            tags.push_back(std::move(tag));
        }
        stripped += ' ';
        i = end;
    }

    return TagExtraction{
        .tags = tags.empty() ? Tags{} : Tags{std::move(tags)},
        .text = util::collapse_whitespace(stripped),
    };
}

// ─── extract ──────────────────────────────────────────────────────────────────

Directives extract(std::string_view raw, Timestamp reference,
                   const aliases::CategoryMap& tag_aliases) {
    const std::string normalized = util::to_lower(util::trim(raw));

    auto stamped = extract_timestamp(normalized, reference);
    auto tagged  = extract_tags(stamped.text, tag_aliases);

    return Directives{
        .timestamp = stamped.timestamp,
        .tags      = std::move(tagged.tags),
        .remainder = std::move(tagged.text),
    };
}

} // namespace vitalog::directives
