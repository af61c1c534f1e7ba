/// @file src/core/errors.cpp
/// @brief Parse failure messages.

#include "vitalog/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace vitalog {

EmptyInputError::EmptyInputError()
    : ParseError("Empty input")
{}

MissingValueError::MissingValueError(EntryKind kind, const std::string& message)
    : ParseError(message)
    , kind_(kind)
{}

RepsParseError::RepsParseError()
    : ParseError("Could not parse reps")
{}

namespace {

std::string inapplicable_message(const std::string& value,
                                 EntryKind kind,
                                 const std::optional<std::string>& dimension) {
    if (!dimension) {
        return fmt::format("Unknown condition: '{}'", value);
    }
    return fmt::format("Condition '{}' ({}) does not apply to {} entries",
                       value, *dimension, to_string(kind));
}

} // anonymous namespace

InapplicableConditionError::InapplicableConditionError(std::string value,
                                                       EntryKind kind,
                                                       std::optional<std::string> dimension)
    : ParseError(inapplicable_message(value, kind, dimension))
    , value_(std::move(value))
    , kind_(kind)
    , dimension_(std::move(dimension))
{}

ConditionConflictError::ConditionConflictError(std::string dimension,
                                               std::string first,
                                               std::string second)
    : ParseError(fmt::format("Cannot specify both '{}' and '{}' ({} dimension)",
                             first, second, dimension))
    , dimension_(std::move(dimension))
    , first_(std::move(first))
    , second_(std::move(second))
{}

} // namespace vitalog
