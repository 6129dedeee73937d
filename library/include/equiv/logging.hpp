#ifndef logging_hpp
#define logging_hpp

#include <memory> // for std::shared_ptr

#include <spdlog/spdlog.h>

/// @brief Runs the given action only if the library's logger logs at the
///   given level. The action can refer to the logger as <code>lg</code>.
#define EQUIV_LOG_CHECK(level, action) \
    do \
    { \
        auto lg = ::equiv::get_logger(); \
        if (lg->should_log(level)) \
        { \
            action; \
        } \
    } while (false)

#define EQUIV_LOG_TRACE(f, ...) \
    EQUIV_LOG_CHECK(spdlog::level::trace, lg->trace(f __VA_OPT__(,) __VA_ARGS__))
#define EQUIV_LOG_DEBUG(f, ...) \
    EQUIV_LOG_CHECK(spdlog::level::debug, lg->debug(f __VA_OPT__(,) __VA_ARGS__))
#define EQUIV_LOG_INFO(f, ...) \
    EQUIV_LOG_CHECK(spdlog::level::info, lg->info(f __VA_OPT__(,) __VA_ARGS__))
#define EQUIV_LOG_WARN(f, ...) \
    EQUIV_LOG_CHECK(spdlog::level::warn, lg->warn(f __VA_OPT__(,) __VA_ARGS__))
#define EQUIV_LOG_ERROR(f, ...) \
    EQUIV_LOG_CHECK(spdlog::level::err, lg->error(f __VA_OPT__(,) __VA_ARGS__))

namespace equiv {

/// @brief Name of the library's logger.
constexpr auto logger_name = "equiv";

/// @brief Name of the environment variable that sets the initial log level.
/// @note Takes the level names spdlog understands, like
///   <code>debug</code> or <code>off</code>.
constexpr auto log_level_variable = "EQUIV_LOG_LEVEL";

/// @brief Gets the library's logger.
/// @note The logger is made on first use, writes to standard error and
///   has the level from <code>EQUIV_LOG_LEVEL</code>, or
///   <code>warn</code> if that isn't set.
auto get_logger() -> std::shared_ptr<spdlog::logger>;

auto set_log_level(spdlog::level::level_enum level) -> void;

auto get_log_level() -> spdlog::level::level_enum;

}

#endif /* logging_hpp */
