#pragma once

/// @file src/util/text.hpp
/// @brief Small ASCII string helpers shared by the parsing modules.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace vitalog::util {

[[nodiscard]] inline bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] inline bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] inline bool is_alpha(char c) noexcept {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] inline std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/// Strip leading/trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
    const auto first = std::find_if_not(text.begin(), text.end(), is_space);
    const auto last  = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (first >= last) {
        return {};
    }
    return text.substr(static_cast<std::size_t>(first - text.begin()),
                       static_cast<std::size_t>(last - first));
}

/// Split on runs of whitespace; no empty tokens.
[[nodiscard]] inline std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && is_space(text[i])) ++i;
        const std::size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;
        if (i > start) {
            tokens.emplace_back(text.substr(start, i - start));
        }
    }
    return tokens;
}

/// Collapse whitespace runs to one space and trim the ends.
[[nodiscard]] inline std::string collapse_whitespace(std::string_view text) {
    std::string out;
    for (const auto& token : split_whitespace(text)) {
        if (!out.empty()) out += ' ';
        out += token;
    }
    return out;
}

/// True if `text` is one or more ASCII digits.
[[nodiscard]] inline bool all_digits(std::string_view text) noexcept {
    return !text.empty() && std::all_of(text.begin(), text.end(), is_digit);
}

/// True if `text` is well-formed UTF-8: no stray continuation bytes, no
/// overlong forms, no surrogates, nothing above U+10FFFF.
[[nodiscard]] inline bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;
            if (lead == 0xED) high = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;
            if (lead == 0xF4) high = 0x8F;
        } else {
            return false;
        }

        if (text.size() - i < length) {
            return false;
        }
        // Only the first continuation byte has a narrowed range.
        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < low || second > high) {
            return false;
        }
        for (std::size_t k = 2; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

} // namespace vitalog::util
