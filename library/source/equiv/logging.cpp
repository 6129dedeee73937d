#include <cstdlib> // for std::getenv
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "equiv/logging.hpp"

namespace equiv {

namespace {

constexpr auto default_level = spdlog::level::warn;

auto initial_level() -> spdlog::level::level_enum
{
    const auto setting = std::getenv(log_level_variable); // NOLINT(concurrency-mt-unsafe)
    if (!setting) {
        return default_level;
    }
    // from_str gives off for names it doesn't know
    const auto level = spdlog::level::from_str(setting);
    if ((level == spdlog::level::off) && (std::string_view{setting} != "off")) {
        return default_level;
    }
    return level;
}

auto make_logger() -> std::shared_ptr<spdlog::logger>
{
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    auto result = spdlog::stderr_color_mt(logger_name);
    result->set_level(initial_level());
    return result;
}

}

auto get_logger() -> std::shared_ptr<spdlog::logger>
{
    static const auto logger = make_logger();
    return logger;
}

auto set_log_level(spdlog::level::level_enum level) -> void
{
    get_logger()->set_level(level);
}

auto get_log_level() -> spdlog::level::level_enum
{
    return get_logger()->level();
}

}
