#pragma once

#include <string>

#include "objkey/core/error.h"

namespace objkey::core {

void InitLogging(const std::string& level);
void LogInfo(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);
/// @brief Log a structured JSON line for a rejected key.
void LogValidationFailure(const std::string& input, const Error& error);

}  // namespace objkey::core
