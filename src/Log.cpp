/**
 * @file Log.cpp
 * @brief spdlog logger setup
 */

#include "confmerge/Log.hpp"
#include "confmerge/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace confmerge {
namespace log {

namespace {
    const char* const kLoggerName = "confmerge";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(kLoggerName);
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(kLoggerName);
        created->set_pattern("[%n] [%^%l%$] %v");
        created->set_level(spdlog::level::warn);
        return created;
    }();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum parse_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        throw OptionsError("unknown log level '" + name + "'");
    }
    return level;
}

} // namespace log
} // namespace confmerge
