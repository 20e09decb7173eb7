#include "katz/core/log.hpp"
#include "katz/config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <string>

namespace katz::log {

namespace {

auto initial_level() -> spdlog::level::level_enum {
    const char* env = std::getenv(KATZ_LOG_LEVEL_ENV);
    if (env == nullptr || env[0] == '\0') {
        return spdlog::level::warn;
    }
    // from_str maps unknown names to off; treat those as the default instead
    const std::string name(env);
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
        return spdlog::level::warn;
    }
    return parsed;
}

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(KATZ_LOGGER_NAME, sink);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(initial_level());
    return created;
}

} // anonymous namespace

auto logger() -> const std::shared_ptr<spdlog::logger>& {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

auto level() -> spdlog::level::level_enum {
    return logger()->level();
}

} // namespace katz::log
