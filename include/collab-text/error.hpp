/// @file error.hpp
/// @brief Error types for the collab-text library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace collab_text {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_metadata,    ///< Metadata does not match its value or is misordered.
    invalid_identifier,  ///< An identifier is malformed.
    encoding_error,      ///< An error occurred during binary encoding.
    decoding_error,      ///< An error occurred during binary decoding.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_metadata:   return "invalid_metadata";
        case ErrorKind::invalid_identifier: return "invalid_identifier";
        case ErrorKind::encoding_error:     return "encoding_error";
        case ErrorKind::decoding_error:     return "decoding_error";
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

}  // namespace collab_text
