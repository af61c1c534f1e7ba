/// @file src/parser/token_patterns.cpp
/// @brief Token classifiers and numeric conversion for the field parsers.

#include "field_parsers.hpp"

#include "vitalog/constants.hpp"
#include "vitalog/errors.hpp"

#include "../util/text.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace vitalog::parser::detail {

namespace {

std::string_view strip_suffix(std::string_view token, std::string_view suffix) noexcept {
    if (token.size() > suffix.size() && token.ends_with(suffix)) {
        token.remove_suffix(suffix.size());
    }
    return token;
}

std::string_view strip_prefix(std::string_view token, std::string_view prefix) noexcept {
    if (token.size() > prefix.size() && token.starts_with(prefix)) {
        token.remove_prefix(prefix.size());
    }
    return token;
}

/// Parse a positive rep or set count.
int count(std::string_view digits) {
    const int value = to_int(digits, "reps");
    if (value <= 0) {
        throw RepsParseError();
    }
    return value;
}

} // anonymous namespace

// ─── Numeric conversion ───────────────────────────────────────────────────────

int to_int(std::string_view token, std::string_view field) {
    int value = 0;
    const char* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), last, value);
    if (token.empty() || ec != std::errc{} || ptr != last) {
        throw std::invalid_argument(fmt::format("Invalid {} value: '{}'", field, token));
    }
    return value;
}

double to_double(std::string_view token, std::string_view field) {
    double value = 0.0;
    const char* last = token.data() + token.size();
    const auto [ptr, ec] = std::from_chars(token.data(), last, value);
    if (token.empty() || ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        throw std::invalid_argument(fmt::format("Invalid {} value: '{}'", field, token));
    }
    return value;
}

// ─── Token patterns ───────────────────────────────────────────────────────────

bool is_decimal(std::string_view token) noexcept {
    const std::size_t dot = token.find('.');
    if (dot == std::string_view::npos) {
        return util::all_digits(token);
    }
    return util::all_digits(token.substr(0, dot)) && util::all_digits(token.substr(dot + 1));
}

std::optional<double> match_weight(std::string_view token) {
    const std::string_view number = strip_suffix(token, "kg");
    if (!is_decimal(number)) {
        return std::nullopt;
    }
    return to_double(number, "weight");
}

bool is_reps_pattern(std::string_view token) noexcept {
    // NxM
    const std::size_t x = token.find('x');
    if (x != std::string_view::npos) {
        return util::all_digits(token.substr(0, x)) && util::all_digits(token.substr(x + 1));
    }

    // n or a,b,c
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = token.find(',', start);
        if (!util::all_digits(token.substr(start, comma - start))) {
            return false;
        }
        if (comma == std::string_view::npos) {
            return true;
        }
        start = comma + 1;
    }
}

std::vector<int> parse_reps(std::string_view token) {
    const std::size_t x = token.find('x');
    if (x != std::string_view::npos) {
        const int sets = count(token.substr(0, x));
        if (sets > constants::MAX_SETS) {
            throw RepsParseError();
        }
        const int reps = count(token.substr(x + 1));
        return std::vector<int>(static_cast<std::size_t>(sets), reps);
    }

    std::vector<int> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t comma = token.find(',', start);
        out.push_back(count(token.substr(start, comma - start)));
        if (comma == std::string_view::npos) {
            return out;
        }
        start = comma + 1;
    }
}

std::optional<double> match_rpe(std::string_view token) {
    const std::string_view number = strip_prefix(token, "rpe");
    if (!is_decimal(number)) {
        return std::nullopt;
    }
    const double value = to_double(number, "RPE");
    if (value < constants::RPE_MIN || value > constants::RPE_MAX) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> match_bodyfat(std::string_view token) {
    const std::string_view number = strip_suffix(token, "%");
    if (!is_decimal(number)) {
        return std::nullopt;
    }
    return to_double(number, "body fat");
}

} // namespace vitalog::parser::detail
