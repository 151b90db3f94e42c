#include "objkey/core/config.h"

#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace objkey::core {

bool IsKnownLogLevel(const std::string& level) {
    return level == "trace" || level == "debug" || level == "information" ||
           level == "warning" || level == "error";
}

bool IsKnownOutputFormat(const std::string& format) {
    return format == "text" || format == "json";
}

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.output.format = cfg->getString("output.format", "text");
    config.resolve.root = cfg->getString("resolve.root", "");
    config.observability.log_level = cfg->getString("observability.log_level", "information");

    if (!IsKnownOutputFormat(config.output.format)) {
        throw std::invalid_argument("output.format must be \"text\" or \"json\", got \"" +
                                    config.output.format + "\"");
    }
    if (!IsKnownLogLevel(config.observability.log_level)) {
        throw std::invalid_argument("unknown observability.log_level \"" +
                                    config.observability.log_level + "\"");
    }
    return config;
}

}  // namespace objkey::core
