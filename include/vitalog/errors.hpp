#pragma once

/// @file include/vitalog/errors.hpp
/// @brief Parse failure types.
///
/// # Taxonomy
/// | failure                 | type                         |
/// |-------------------------|------------------------------|
/// | nothing left to parse   | EmptyInputError              |
/// | primary value missing   | MissingValueError            |
/// | no reps pattern         | RepsParseError               |
/// | condition not for kind  | InapplicableConditionError   |
/// | two values, one axis    | ConditionConflictError       |
/// | malformed number        | std::invalid_argument        |
///
/// All vitalog errors derive from ParseError, which is itself a
/// `std::invalid_argument`: catching `std::invalid_argument` therefore covers
/// every way a parse can fail.

#include "vitalog/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace vitalog {

/// Base of every typed parse failure.
class ParseError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// No tokens remain once directives have been stripped.
class EmptyInputError : public ParseError {
public:
    EmptyInputError();
};

/// A metric entry lacks its mandatory primary value.
class MissingValueError : public ParseError {
public:
    MissingValueError(EntryKind kind, const std::string& message);

    [[nodiscard]] EntryKind kind() const noexcept { return kind_; }

private:
    EntryKind kind_;
};

/// An exercise entry never produced a reps pattern.
class RepsParseError : public ParseError {
public:
    RepsParseError();
};

/// A recognized condition value whose dimension does not apply to the entry
/// kind, or (with no dimension) a value that is not a condition at all.
class InapplicableConditionError : public ParseError {
public:
    InapplicableConditionError(std::string value,
                               EntryKind kind,
                               std::optional<std::string> dimension);

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] EntryKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<std::string>& dimension() const noexcept {
        return dimension_;
    }

private:
    std::string                value_;
    EntryKind                  kind_;
    std::optional<std::string> dimension_;
};

/// Two values of the same dimension were supplied for one entry.
class ConditionConflictError : public ParseError {
public:
    ConditionConflictError(std::string dimension, std::string first, std::string second);

    [[nodiscard]] const std::string& dimension() const noexcept { return dimension_; }
    [[nodiscard]] const std::string& first() const noexcept { return first_; }
    [[nodiscard]] const std::string& second() const noexcept { return second_; }

private:
    std::string dimension_;
    std::string first_;
    std::string second_;
};

} // namespace vitalog
