/**
 * @file Component.hpp
 * @brief Component and event kind identifiers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_COMPONENT_HPP
    #define VGL_ECS_COMPONENT_HPP

#include <vgl/core/Constants.hpp>
#include <vgl/core/Types.hpp>

namespace vgl::ecs {

/**
 * @enum ComponentId
 * @brief Kind of a component carried by an entity.
 *
 * The first values are reserved for the runtime's own observer
 * bookkeeping.  Application kinds start at @c FirstUser and must stay
 * below @c Count; they are built as @c ComponentId{n}.
 */
enum class ComponentId : core::u16
{
    ObservedBy = 0,
    Observer   = 1,

    FirstUser  = 8,
    Count      = core::kMaxComponentKinds,

    None       = 0xFFFF
};

/**
 * @enum EventId
 * @brief Kind of an event observers can react to.
 *
 * Open enumeration: the runtime defines no event kinds of its own, the
 * application names them as @c EventId{n}.
 */
enum class EventId : core::u16
{
};

/** @brief Returns the first application component kind offset by @p n. */
[[nodiscard]] constexpr ComponentId userComponent(core::u16 n) noexcept
{
    return static_cast<ComponentId>(static_cast<core::u16>(ComponentId::FirstUser) + n);
}

/** @brief Tests whether @p id is one of the runtime's reserved kinds. */
[[nodiscard]] constexpr bool isBuiltin(ComponentId id) noexcept
{
    return static_cast<core::u16>(id) < static_cast<core::u16>(ComponentId::FirstUser);
}

/** @brief Tests whether @p id fits in an Archetype mask. */
[[nodiscard]] constexpr bool isStorable(ComponentId id) noexcept
{
    return static_cast<core::u16>(id) < static_cast<core::u16>(ComponentId::Count);
}

} // namespace vgl::ecs

#endif // VGL_ECS_COMPONENT_HPP
