/**
 * @file Hooks.hpp
 * @brief Component lifecycle hook signature.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_HOOKS_HPP
    #define VGL_ECS_HOOKS_HPP

#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/Entity.hpp>

namespace vgl::ecs {

class DeferredWorld;

/**
 * @struct HookContext
 * @brief Identifies the entity and component a hook fires for.
 */
struct HookContext
{
    EntityId    entity{};
    ComponentId component{ComponentId::None};
};

/**
 * @brief Hook invoked synchronously while the component is still present.
 *
 * The hook only gets a DeferredWorld: it may read and mutate existing
 * components and enqueue commands, never change structure inline.
 */
using ComponentHook = void (*)(DeferredWorld& world, HookContext ctx);

} // namespace vgl::ecs

#endif // VGL_ECS_HOOKS_HPP
