#include "objkey/key/component_validator.h"

#include <string>

namespace objkey::key {

namespace {

std::string Quote(std::string_view component) {
    std::string out;
    out.reserve(component.size() + 2);
    out += '\'';
    for (char c : component) {
        out += core::DescribeCharacter(c);
    }
    out += '\'';
    return out;
}

core::Error MakeError(core::ErrorCode code, std::string_view component,
                      const std::string& reason) {
    core::Error error;
    error.code = code;
    error.component = std::string(component);
    error.message = "invalid key component " + Quote(component) + ": " + reason;
    return error;
}

}  // namespace

bool IsAllowedCharacter(char c) {
    // Explicit ranges keep the check ASCII-only regardless of the active locale.
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.';
}

core::Result<std::string_view> ValidateComponent(std::string_view candidate) {
    if (candidate.empty()) {
        return MakeError(core::ErrorCode::kEmptyComponent, candidate,
                         "empty component is not allowed");
    }
    for (std::size_t i = 0; i < candidate.size(); ++i) {
        const char c = candidate[i];
        if (!IsAllowedCharacter(c)) {
            auto error = MakeError(core::ErrorCode::kInvalidCharacter, candidate,
                                   "character '" + core::DescribeCharacter(c) + "' at offset " +
                                       std::to_string(i) + " is not allowed");
            error.character = c;
            error.offset = i;
            return error;
        }
    }
    if (candidate == "." || candidate == "..") {
        return MakeError(core::ErrorCode::kTraversalSegment, candidate,
                         "traversal segment is not allowed");
    }
    return candidate;
}

bool IsValidComponent(std::string_view candidate) {
    return ValidateComponent(candidate).ok();
}

}  // namespace objkey::key
