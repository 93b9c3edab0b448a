// /////////////////////////////////////////////////////////////////////////////
/// @file WorldConfig.cpp
/// @brief WorldConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <vgl/ecs/WorldConfig.hpp>

namespace vgl::ecs {

WorldConfig::Builder& WorldConfig::Builder::initialCapacity(core::u32 n) noexcept
{
    initialCapacity_ = n;
    return *this;
}

WorldConfig::Builder& WorldConfig::Builder::pruneStaleIndex(bool enabled) noexcept
{
    pruneStaleIndex_ = enabled;
    return *this;
}

WorldConfig::Builder& WorldConfig::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

WorldConfig WorldConfig::Builder::build() const noexcept
{
    WorldConfig cfg;
    cfg.initialCapacity_ = initialCapacity_;
    cfg.pruneStaleIndex_ = pruneStaleIndex_;
    cfg.logLevel_        = logLevel_;
    return cfg;
}

} // namespace vgl::ecs
