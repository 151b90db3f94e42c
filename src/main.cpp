#include <exception>
#include <iostream>

#include <Poco/Exception.h>

#include "objkey/cli/check_command.h"
#include "objkey/core/logger.h"

int main(int argc, char** argv) {
    auto parsed = objkey::cli::ParseArgs(argc, argv);
    if (!parsed.ok()) {
        std::cerr << "objkey-check: " << parsed.error().message << "\n\n"
                  << objkey::cli::Usage();
        return objkey::cli::kExitUsage;
    }
    const auto& options = parsed.value();
    if (options.help) {
        std::cout << objkey::cli::Usage();
        return objkey::cli::kExitOk;
    }

    objkey::core::Config config;
    try {
        config = objkey::cli::LoadEffectiveConfig(options);
    } catch (const Poco::Exception& ex) {
        std::cerr << "objkey-check: failed to load config " << options.config_path << ": "
                  << ex.displayText() << '\n';
        return objkey::cli::kExitUsage;
    } catch (const std::exception& ex) {
        std::cerr << "objkey-check: failed to load config " << options.config_path << ": "
                  << ex.what() << '\n';
        return objkey::cli::kExitUsage;
    }
    objkey::core::InitLogging(config.observability.log_level);
    objkey::core::LogDebug("loaded config " + options.config_path);

    return objkey::cli::RunCheck(options, config, std::cout, std::cerr);
}
