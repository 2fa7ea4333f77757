/// @file error.hpp
/// @brief Error types for the docsnap-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docsnap_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_arguments,        ///< The caller supplied insufficient or invalid input.
    snapshot_store_required,  ///< A snapshot operation needs a snapshot store that is not configured.
    schema_not_found,         ///< No schema is registered under the requested name.
    document_not_found,       ///< The document store has no record for the id.
    invalid_change,           ///< A change violates the append-only change log.
    invalid_operation,        ///< An operation cannot be applied to the document.
    decoding_error,           ///< Persisted data could not be decoded.
    storage_error,            ///< A store failed to read or write.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_arguments:       return "invalid_arguments";
        case ErrorKind::snapshot_store_required: return "snapshot_store_required";
        case ErrorKind::schema_not_found:        return "schema_not_found";
        case ErrorKind::document_not_found:      return "document_not_found";
        case ErrorKind::invalid_change:          return "invalid_change";
        case ErrorKind::invalid_operation:       return "invalid_operation";
        case ErrorKind::decoding_error:          return "decoding_error";
        case ErrorKind::storage_error:           return "storage_error";
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

/// Exception carrying a structured Error.
///
/// Every failure raised by the library (and by the bundled store
/// implementations) is a SnapshotError. `what()` is formatted as
/// "<kind>: <message>".
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    SnapshotError(ErrorKind kind, std::string message)
        : SnapshotError{Error{kind, std::move(message)}} {}

    /// The structured error.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace docsnap_cpp
