#include "objkey/core/logger.h"

#include <iostream>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/Logger.h>
#include <Poco/PatternFormatter.h>

namespace objkey::core {

namespace {
constexpr char kHexDigits[] = "0123456789abcdef";

Poco::Logger& RootLogger() {
    return Poco::Logger::get("objkey");
}

std::string EscapeJson(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        switch (ch) {
            case '\"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    out += "\\u00";
                    out += kHexDigits[(ch >> 4) & 0x0f];
                    out += kHexDigits[ch & 0x0f];
                } else {
                    out += ch;
                }
                break;
        }
    }
    return out;
}

int ToPocoLevel(const std::string& level) {
    if (level == "trace") {
        return Poco::Message::PRIO_TRACE;
    }
    if (level == "debug") {
        return Poco::Message::PRIO_DEBUG;
    }
    if (level == "warning") {
        return Poco::Message::PRIO_WARNING;
    }
    if (level == "error") {
        return Poco::Message::PRIO_ERROR;
    }
    return Poco::Message::PRIO_INFORMATION;
}
}  // namespace

void InitLogging(const std::string& level) {
    Poco::AutoPtr<Poco::ConsoleChannel> console(new Poco::ConsoleChannel(std::clog));
    Poco::AutoPtr<Poco::PatternFormatter> formatter(
        new Poco::PatternFormatter("%Y-%m-%dT%H:%M:%S.%iZ [%p] %t"));
    Poco::AutoPtr<Poco::FormattingChannel> channel(new Poco::FormattingChannel(formatter, console));
    RootLogger().setChannel(channel);
    RootLogger().setLevel(ToPocoLevel(level));
}

void LogInfo(const std::string& message) { RootLogger().information(message); }
void LogError(const std::string& message) { RootLogger().error(message); }
void LogDebug(const std::string& message) { RootLogger().debug(message); }

void LogValidationFailure(const std::string& input, const Error& error) {
    std::string message = "{\"event\":\"key_rejected\",\"input\":\"" + EscapeJson(input) +
                          "\",\"code\":\"" + ErrorCodeName(error.code) +
                          "\",\"component\":\"" + EscapeJson(error.component) + "\"";
    if (error.index) {
        message += ",\"index\":" + std::to_string(*error.index);
    }
    if (error.offset) {
        message += ",\"offset\":" + std::to_string(*error.offset);
    }
    message += "}";
    LogError(message);
}

}  // namespace objkey::core
