/// @file error.hpp
/// @brief Error types for the docdiff-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace docdiff_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    duplicate_identity,     ///< Sibling array elements share an identity token.
    missing_identity,       ///< An array required to be identifiable has an element without identity.
    path_not_found,         ///< A path segment does not exist in the tree.
    identity_not_found,     ///< An identity token has no matching sibling in the target.
    type_mismatch,          ///< A node is of the wrong kind for the requested operation.
    unsupported_operation,  ///< A change operation outside add/remove/replace.
    invalid_change,         ///< A change is malformed (missing path or value).
    invalid_pointer,        ///< A JSON Pointer string is malformed.
    invalid_config,         ///< A configuration document is malformed or unreadable.
    version_out_of_range,   ///< A requested version is not covered by the version chain.
    version_conflict,       ///< A save was rejected because the stored version moved on.
    codec_error,            ///< A diff record could not be encoded or decoded.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::duplicate_identity:    return "duplicate_identity";
        case ErrorKind::missing_identity:      return "missing_identity";
        case ErrorKind::path_not_found:        return "path_not_found";
        case ErrorKind::identity_not_found:    return "identity_not_found";
        case ErrorKind::type_mismatch:         return "type_mismatch";
        case ErrorKind::unsupported_operation: return "unsupported_operation";
        case ErrorKind::invalid_change:        return "invalid_change";
        case ErrorKind::invalid_pointer:       return "invalid_pointer";
        case ErrorKind::invalid_config:        return "invalid_config";
        case ErrorKind::version_out_of_range:  return "version_out_of_range";
        case ErrorKind::version_conflict:      return "version_conflict";
        case ErrorKind::codec_error:           return "codec_error";
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

/// The exception thrown by every failing docdiff-cpp operation.
///
/// what() is "<kind>: <message>"; the structured Error is available
/// through error() for callers that branch on the category.
class DiffException : public std::runtime_error {
public:
    DiffException(ErrorKind kind, std::string message)
        : std::runtime_error{std::string{to_string_view(kind)} + ": " + message},
          error_{kind, std::move(message)} {}

    explicit DiffException(Error error)
        : DiffException{error.kind, std::move(error.message)} {}

    auto kind() const noexcept -> ErrorKind { return error_.kind; }
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace docdiff_cpp
