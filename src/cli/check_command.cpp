#include "objkey/cli/check_command.h"

#include <filesystem>
#include <sstream>

#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>

#include "objkey/core/logger.h"
#include "objkey/key/key_path.h"

namespace objkey::cli {

namespace {

core::Error UsageError(const std::string& message) {
    core::Error error;
    error.code = core::ErrorCode::kInvalidArgument;
    error.message = message;
    return error;
}

/// One key to report: the text it came from and the outcome of building it.
struct CheckedKey {
    std::string input;
    core::Result<key::KeyPath> result;
};

std::vector<CheckedKey> BuildKeys(const CheckOptions& options) {
    std::vector<CheckedKey> keys;
    if (options.split) {
        for (const auto& input : options.inputs) {
            keys.push_back({input, key::KeyPath::FromDelimited(input)});
        }
        return keys;
    }
    std::string label;
    for (const auto& input : options.inputs) {
        if (!label.empty()) {
            label += ' ';
        }
        label += input;
    }
    keys.push_back({label, key::KeyPath::Create(options.inputs)});
    return keys;
}

std::string Stringify(const Poco::JSON::Object::Ptr& obj) {
    std::stringstream ss;
    obj->stringify(ss);
    return ss.str();
}

Poco::JSON::Object::Ptr KeyToJson(const key::KeyPath& path, const core::Config& config) {
    Poco::JSON::Array::Ptr components = new Poco::JSON::Array();
    for (const auto& component : path.components()) {
        components->add(component);
    }
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("key", path.Render());
    obj->set("components", components);
    if (!config.resolve.root.empty()) {
        obj->set("path", path.ResolveUnder(config.resolve.root).string());
    }
    return obj;
}

Poco::JSON::Object::Ptr ErrorToJson(const std::string& input, const core::Error& error) {
    Poco::JSON::Object::Ptr detail = new Poco::JSON::Object();
    detail->set("code", std::string(core::ErrorCodeName(error.code)));
    detail->set("message", error.message);
    detail->set("input", input);
    detail->set("component", error.component);
    if (error.index) {
        detail->set("index", static_cast<Poco::UInt64>(*error.index));
    }
    if (error.character) {
        detail->set("character", core::DescribeCharacter(*error.character));
    }
    if (error.offset) {
        detail->set("offset", static_cast<Poco::UInt64>(*error.offset));
    }
    Poco::JSON::Object::Ptr obj = new Poco::JSON::Object();
    obj->set("error", detail);
    return obj;
}

}  // namespace

core::Result<CheckOptions> ParseArgs(int argc, const char* const* argv) {
    CheckOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
            return options;
        }
        if (arg == "--split") {
            options.split = true;
            continue;
        }
        if (arg == "--config" || arg == "--root" || arg == "--format") {
            if (i + 1 >= argc) {
                return UsageError("missing value for " + arg);
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
                options.config_explicit = true;
            } else if (arg == "--root") {
                options.root = value;
            } else {
                if (!core::IsKnownOutputFormat(value)) {
                    return UsageError("--format must be text or json, got " + value);
                }
                options.format = value;
            }
            continue;
        }
        if (arg == "--") {
            for (++i; i < argc; ++i) {
                options.inputs.emplace_back(argv[i]);
            }
            break;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            return UsageError("unknown option " + arg);
        }
        options.inputs.push_back(arg);
    }
    if (options.inputs.empty()) {
        return UsageError("no key given");
    }
    return options;
}

core::Config LoadEffectiveConfig(const CheckOptions& options) {
    core::Config config;
    if (options.config_explicit || std::filesystem::exists(options.config_path)) {
        config = core::LoadConfig(options.config_path);
    }
    if (options.root) {
        config.resolve.root = *options.root;
    }
    if (options.format) {
        config.output.format = *options.format;
    }
    return config;
}

int RunCheck(const CheckOptions& options, const core::Config& config, std::ostream& out,
             std::ostream& err) {
    const bool json = config.output.format == "json";
    int status = kExitOk;
    for (const auto& checked : BuildKeys(options)) {
        if (!checked.result.ok()) {
            status = kExitInvalidKey;
            const auto& error = checked.result.error();
            core::LogValidationFailure(checked.input, error);
            if (json) {
                out << Stringify(ErrorToJson(checked.input, error)) << '\n';
            } else {
                err << "error: " << error.message << '\n';
            }
            continue;
        }
        const auto& path = checked.result.value();
        core::LogDebug("accepted key " + path.Render());
        if (json) {
            out << Stringify(KeyToJson(path, config)) << '\n';
        } else if (!config.resolve.root.empty()) {
            out << path.ResolveUnder(config.resolve.root).string() << '\n';
        } else {
            out << path << '\n';
        }
    }
    return status;
}

std::string Usage() {
    return "usage: objkey-check [--config <file>] [--root <dir>] [--split] "
           "[--format text|json] <arg>...\n"
           "\n"
           "Without --split all arguments are the components of one key.\n"
           "With --split every argument is a '/'-delimited key checked on its own.\n"
           "\n"
           "exit status: 0 all keys valid, 1 a key was rejected, 2 usage or config error\n";
}

}  // namespace objkey::cli
