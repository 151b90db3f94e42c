#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace objkey::core {

/// @brief Error codes reported by key validation and the command-line front end.
enum class ErrorCode {
    kOk = 0,
    kEmptyComponent,
    kInvalidCharacter,
    kTraversalSegment,
    kInvalidArgument,
};

/// @brief Error payload describing a failure with a code and human-readable message.
///
/// Validation failures fill in the component details; fields that do not apply to
/// the failure kind stay empty.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
    std::string component;
    std::optional<std::size_t> index;
    std::optional<char> character;
    std::optional<std::size_t> offset;
};

/// @brief Stable upper-case name for an error code, e.g. "INVALID_CHARACTER".
const char* ErrorCodeName(ErrorCode code);

/// @brief Printable form of a single byte; non-printable bytes become "\xNN".
std::string DescribeCharacter(char c);

}  // namespace objkey::core
