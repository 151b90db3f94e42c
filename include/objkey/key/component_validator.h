#pragma once

#include <string_view>

#include "objkey/core/result.h"

namespace objkey::key {

/// @brief Separator placed between components when a key is rendered.
inline constexpr char kSeparator = '/';

/// @brief True for the bytes a key component may contain: ASCII letters, digits, '-', '_', '.'.
bool IsAllowedCharacter(char c);

/// @brief Validate a single key component.
///
/// A component is accepted when it is non-empty, contains only whitelisted bytes and
/// is not exactly "." or "..". On success the candidate is returned unchanged. The
/// returned error never has `index` set; callers that know the component's position
/// fill it in.
core::Result<std::string_view> ValidateComponent(std::string_view candidate);

bool IsValidComponent(std::string_view candidate);

}  // namespace objkey::key
