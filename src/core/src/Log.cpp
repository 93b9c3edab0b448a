/**
 * @file Log.cpp
 * @brief Log filter, sink selection and the stderr fallback sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "vgl/core/Log.hpp"

#include <cstdio>

namespace vgl::core {

namespace {

/** @brief Writes "[LEVEL][TAG] message" lines to stderr. */
class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, LogTag tag, std::string_view message) override
    {
        const std::string_view levelName = toString(level);
        const std::string_view tagName   = toString(tag);
        std::fprintf(stderr, "[%-5.*s][%.*s] %.*s\n",
                     static_cast<int>(levelName.size()), levelName.data(),
                     static_cast<int>(tagName.size()), tagName.data(),
                     static_cast<int>(message.size()), message.data());
    }
};

struct LogState
{
    StderrLogger fallback;
    ILogger     *sink{&fallback};
    LogLevel     minLevel{LogLevel::kInfo};
};

LogState &state()
{
    static LogState instance;
    return instance;
}

void emit(LogLevel level, LogTag tag, std::string_view msg)
{
    if (!Log::enabled(level))
        return;
    state().sink->write(level, tag, msg);
}

} // anonymous namespace

void Log::setLogger(ILogger *logger)
{
    state().sink = logger != nullptr ? logger : &state().fallback;
}

void Log::setMinLevel(LogLevel level) { state().minLevel = level; }
LogLevel Log::minLevel()              { return state().minLevel; }
bool Log::enabled(LogLevel level)     { return level >= state().minLevel; }

void Log::debug(LogTag tag, std::string_view msg) { emit(LogLevel::kDebug, tag, msg); }
void Log::info (LogTag tag, std::string_view msg) { emit(LogLevel::kInfo,  tag, msg); }
void Log::warn (LogTag tag, std::string_view msg) { emit(LogLevel::kWarn,  tag, msg); }
void Log::error(LogTag tag, std::string_view msg) { emit(LogLevel::kError, tag, msg); }
void Log::fatal(LogTag tag, std::string_view msg) { emit(LogLevel::kFatal, tag, msg); }

} // namespace vgl::core
