/// @file error.hpp
/// @brief Error types for the mergeguard library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mergeguard {

/// Categories of errors that can occur during an analysis run.
enum class ErrorKind : std::uint8_t {
    invalid_diff,              ///< A FileDiff is malformed (inverted or overlapping ranges).
    invalid_symbol,            ///< Symbol data is malformed (inverted or crossing ranges).
    invalid_proposal,          ///< A ChangeProposal is malformed (duplicate files, bad confidence).
    invalid_decision,          ///< A recorded Decision is malformed (no entity, empty pattern).
    analysis_failed,           ///< A proposal's guardrail or regression checks threw.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_diff:             return "invalid_diff";
        case ErrorKind::invalid_symbol:           return "invalid_symbol";
        case ErrorKind::invalid_proposal:         return "invalid_proposal";
        case ErrorKind::invalid_decision:         return "invalid_decision";
        case ErrorKind::analysis_failed:          return "analysis_failed";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
///
/// Errors are values: they annotate reports rather than unwind the run.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Thrown by validate() on malformed input data.
///
/// Derives from std::invalid_argument; kind() says which input was at fault.
class InputError : public std::invalid_argument {
public:
    InputError(ErrorKind kind, const std::string& what)
        : std::invalid_argument{what}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

private:
    ErrorKind kind_;
};

/// Thrown when configuration fails validation. Always fatal to a run.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error{what} {}
};

}  // namespace mergeguard
