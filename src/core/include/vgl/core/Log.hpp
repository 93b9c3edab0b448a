/**
 * @file Log.hpp
 * @brief Severity-filtered log façade tagged by runtime subsystem.
 *
 * Messages go to an injectable ILogger; the default sink writes to stderr.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_LOG_HPP
    #define VGL_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace vgl::core {

enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Subsystem a message originates from.
 *
 * - @c kEcs    : registry, world, commands and cloning.
 * - @c kObs    : observer registration, cascade and clone propagation.
 * - @c kAssert : failed contract checks.
 */
enum class LogTag : u8 {
    kEcs = 0,
    kObs,
    kAssert
};

[[nodiscard]] constexpr std::string_view toString(LogTag tag) noexcept
{
    switch (tag)
    {
        case LogTag::kEcs:    return "ECS";
        case LogTag::kObs:    return "OBS";
        case LogTag::kAssert: return "ASSERT";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO";
        case LogLevel::kWarn:  return "WARN";
        case LogLevel::kError: return "ERROR";
        case LogLevel::kFatal: return "FATAL";
    }
    return "?";
}

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void write(LogLevel level, LogTag tag, std::string_view message) = 0;
};

/**
 * @brief Process-wide logging entry point.
 *
 * The filter and the sink are shared by every World in the process.
 */
class Log final {
public:
    Log() = delete;

    /** @brief Installs @p logger, or restores the stderr sink when null. */
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /** @brief Whether a message of @p level would reach the sink. */
    [[nodiscard]] static bool enabled(LogLevel level);

    static void debug(LogTag tag, std::string_view msg);
    static void info (LogTag tag, std::string_view msg);
    static void warn (LogTag tag, std::string_view msg);
    static void error(LogTag tag, std::string_view msg);
    static void fatal(LogTag tag, std::string_view msg);
};

} // namespace vgl::core

#endif // VGL_CORE_LOG_HPP
