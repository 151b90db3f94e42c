#pragma once

#include <string>

namespace objkey::core {

/// @brief Output settings for the command-line checker.
struct OutputConfig {
    std::string format{"text"};
};

/// @brief Directory under which accepted keys are resolved; empty disables resolution.
struct ResolveConfig {
    std::string root;
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Top-level configuration for objkey-check.
struct Config {
    OutputConfig output;
    ResolveConfig resolve;
    ObservabilityConfig observability;
};

/// @brief Load configuration from a JSON file.
///
/// Throws std::invalid_argument for an unknown output format or log level, and the
/// Poco exception raised by the parser when the file cannot be read or parsed.
Config LoadConfig(const std::string& path);

bool IsKnownLogLevel(const std::string& level);
bool IsKnownOutputFormat(const std::string& format);

}  // namespace objkey::core
