/// @file error.hpp
/// @brief Error types for the jsondiff-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jsondiff_cpp {

/// Categories of errors that can occur in the library.
///
/// Unresolvable references (an identity value absent from a tree, an index
/// out of bounds) are not errors: those surface as empty optionals.
enum class ErrorKind : std::uint8_t {
    malformed_path,   ///< A path string does not follow the path grammar.
    wrong_dialect,    ///< A well-formed path used where another dialect is required.
    viewer_mismatch,  ///< A viewer-prefixed path was queried against the other viewer.
    invalid_value,    ///< JSON text could not be converted to a Value.
    invalid_option,   ///< A comparison option is outside its valid range.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_path:  return "malformed_path";
        case ErrorKind::wrong_dialect:   return "wrong_dialect";
        case ErrorKind::viewer_mismatch: return "viewer_mismatch";
        case ErrorKind::invalid_value:   return "invalid_value";
        case ErrorKind::invalid_option:  return "invalid_option";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base class of every exception thrown by the library.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error err)
        : std::runtime_error{err.message}, error_{std::move(err)} {}

    /// The structured error carried by this exception.
    auto error() const noexcept -> const Error& { return error_; }

    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

/// Thrown for malformed path strings and dialect violations.
class PathError : public Exception {
public:
    PathError(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}
};

/// Thrown when JSON text cannot be converted to a Value.
class ValueError : public Exception {
public:
    explicit ValueError(std::string message)
        : Exception{Error{ErrorKind::invalid_value, std::move(message)}} {}
};

/// Thrown when comparison options fail validation.
class OptionsError : public Exception {
public:
    explicit OptionsError(std::string message)
        : Exception{Error{ErrorKind::invalid_option, std::move(message)}} {}
};

}  // namespace jsondiff_cpp
