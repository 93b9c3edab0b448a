// /////////////////////////////////////////////////////////////////////////////
/// @file WorldConfig.hpp
/// @brief World configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#ifndef VGL_ECS_WORLDCONFIG_HPP
    #define VGL_ECS_WORLDCONFIG_HPP

#include <vgl/core/Constants.hpp>
#include <vgl/core/Log.hpp>
#include <vgl/core/Types.hpp>

#include <optional>

namespace vgl::ecs {

/// @brief Immutable world configuration.
class WorldConfig
{
public:
    /// @brief Fluent builder for WorldConfig.
    class Builder
    {
    public:
        /// @brief Entity slots reserved when the world is created.
        Builder& initialCapacity(core::u32 n) noexcept;

        /// @brief Erase global-index entries keyed by a watched entity when
        ///        that entity is despawned.
        Builder& pruneStaleIndex(bool enabled) noexcept;

        /// @brief Minimum log severity installed when the world is created.
        ///
        /// The level is process-wide: it applies to every world. A world
        /// built without this call leaves the current level untouched.
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] WorldConfig build() const noexcept;

    private:
        core::u32      initialCapacity_{core::kDefaultInitialCapacity};
        bool           pruneStaleIndex_{true};
        std::optional<core::LogLevel> logLevel_;
    };

    [[nodiscard]] core::u32      initialCapacity() const noexcept { return initialCapacity_; }
    [[nodiscard]] bool           pruneStaleIndex() const noexcept { return pruneStaleIndex_; }
    [[nodiscard]] std::optional<core::LogLevel> logLevel() const noexcept { return logLevel_; }

private:
    friend class Builder;

    core::u32      initialCapacity_{core::kDefaultInitialCapacity};
    bool           pruneStaleIndex_{true};
    std::optional<core::LogLevel> logLevel_;
};

} // namespace vgl::ecs

#endif // VGL_ECS_WORLDCONFIG_HPP
