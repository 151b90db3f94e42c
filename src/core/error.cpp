#include "objkey/core/error.h"

#include <cstdio>

namespace objkey::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kEmptyComponent:
            return "EMPTY_COMPONENT";
        case ErrorCode::kInvalidCharacter:
            return "INVALID_CHARACTER";
        case ErrorCode::kTraversalSegment:
            return "TRAVERSAL_SEGMENT";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
    }
    return "UNKNOWN";
}

std::string DescribeCharacter(char c) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7f) {
        return std::string(1, c);
    }
    char buffer[5];
    std::snprintf(buffer, sizeof(buffer), "\\x%02X", static_cast<unsigned int>(byte));
    return buffer;
}

}  // namespace objkey::core
