#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "objkey/core/config.h"
#include "objkey/core/result.h"

namespace objkey::cli {

constexpr int kExitOk = 0;
constexpr int kExitInvalidKey = 1;
constexpr int kExitUsage = 2;

inline constexpr const char* kDefaultConfigPath = "config/objkey.json";

/// @brief Parsed command line of objkey-check.
struct CheckOptions {
    std::string config_path{kDefaultConfigPath};
    bool config_explicit{false};
    std::optional<std::string> root;
    std::optional<std::string> format;
    bool split{false};
    bool help{false};
    std::vector<std::string> inputs;
};

/// @brief Parse argv. Unknown options, missing option values and an empty input list
/// are reported as kInvalidArgument.
core::Result<CheckOptions> ParseArgs(int argc, const char* const* argv);

/// @brief Load the configuration file named by the options and apply command-line overrides.
///
/// A missing default config file yields the built-in defaults; a missing or malformed
/// file passed with --config throws.
core::Config LoadEffectiveConfig(const CheckOptions& options);

/// @brief Validate the inputs and report each key on `out`/`err`.
/// @return kExitOk when every key is valid, kExitInvalidKey otherwise.
int RunCheck(const CheckOptions& options, const core::Config& config, std::ostream& out,
             std::ostream& err);

std::string Usage();

}  // namespace objkey::cli
