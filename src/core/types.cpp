/// @file src/core/types.cpp
/// @brief EntryKind tags and timestamp helpers.

#include "vitalog/types.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <ctime>
#include <stdexcept>

namespace vitalog {

// ─── EntryKind ────────────────────────────────────────────────────────────────

std::string_view to_string(EntryKind kind) noexcept {
    switch (kind) {
        case EntryKind::Exercise:     return "exercise";
        case EntryKind::HeartRate:    return "hr";
        case EntryKind::Hrv:          return "hrv";
        case EntryKind::Temperature:  return "temp";
        case EntryKind::Bodyweight:   return "weight";
        case EntryKind::ControlPause: return "cp";
    }
    return "unknown";
}

std::optional<EntryKind> entry_kind_from_string(std::string_view tag) noexcept {
    for (EntryKind kind : {EntryKind::Exercise, EntryKind::HeartRate, EntryKind::Hrv,
                           EntryKind::Temperature, EntryKind::Bodyweight,
                           EntryKind::ControlPause}) {
        if (to_string(kind) == tag) {
            return kind;
        }
    }
    return std::nullopt;
}

// ─── Timestamp construction ───────────────────────────────────────────────────

Timestamp make_timestamp(int year, unsigned month, unsigned day,
                         int hour, int minute, int second) {
    using namespace std::chrono;

    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                             std::chrono::day{day}};
    if (!ymd.ok()) {
        throw std::invalid_argument(
            fmt::format("invalid date {:04}-{:02}-{:02}", year, month, day));
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw std::invalid_argument(
            fmt::format("invalid time {:02}:{:02}:{:02}", hour, minute, second));
    }

    return sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
}

Timestamp local_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    // tm_sec may read 60 during a leap second.
    return make_timestamp(local.tm_year + 1900,
                          static_cast<unsigned>(local.tm_mon + 1),
                          static_cast<unsigned>(local.tm_mday),
                          local.tm_hour, local.tm_min, std::min(local.tm_sec, 59));
}

// ─── ISO-8601 ─────────────────────────────────────────────────────────────────

std::string format_iso8601(Timestamp ts) {
    using namespace std::chrono;

    const auto midnight = floor<days>(ts);
    const year_month_day ymd{midnight};
    const hh_mm_ss<seconds> hms{ts - midnight};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count());
}

namespace {

/// Read exactly `width` digits starting at `pos`.
int fixed_digits(std::string_view text, std::size_t pos, std::size_t width) {
    if (pos + width > text.size()) {
        throw std::invalid_argument(fmt::format("truncated timestamp '{}'", text));
    }
    const char* first = text.data() + pos;
    const char* last  = first + width;
    if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument(fmt::format("malformed timestamp '{}'", text));
    }
    int value = 0;
    std::from_chars(first, last, value);
    return value;
}

void expect_char(std::string_view text, std::size_t pos, char expected) {
    if (pos >= text.size() || text[pos] != expected) {
        throw std::invalid_argument(fmt::format("malformed timestamp '{}'", text));
    }
}

} // anonymous namespace

Timestamp parse_iso8601(std::string_view text) {
    // YYYY-MM-DD
    const int year = fixed_digits(text, 0, 4);
    expect_char(text, 4, '-');
    const int month = fixed_digits(text, 5, 2);
    expect_char(text, 7, '-');
    const int day = fixed_digits(text, 8, 2);

    int hour = 0;
    int minute = 0;
    int second = 0;
    if (text.size() > 10) {
        // [T ]HH:MM[:SS]
        if (text[10] != 'T' && text[10] != ' ') {
            throw std::invalid_argument(fmt::format("malformed timestamp '{}'", text));
        }
        hour = fixed_digits(text, 11, 2);
        expect_char(text, 13, ':');
        minute = fixed_digits(text, 14, 2);
        if (text.size() > 16) {
            expect_char(text, 16, ':');
            second = fixed_digits(text, 17, 2);
            if (text.size() != 19) {
                throw std::invalid_argument(fmt::format("malformed timestamp '{}'", text));
            }
        }
    }

    return make_timestamp(year, static_cast<unsigned>(month), static_cast<unsigned>(day),
                          hour, minute, second);
}

} // namespace vitalog
