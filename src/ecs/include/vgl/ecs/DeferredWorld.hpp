/**
 * @file DeferredWorld.hpp
 * @brief Non-structural view of a World handed to reactive code.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_DEFERREDWORLD_HPP
    #define VGL_ECS_DEFERREDWORLD_HPP

#include <vgl/ecs/CommandQueue.hpp>
#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/Entity.hpp>

namespace vgl::ecs {

class World;
class WorldConfig;
class ObservedBy;
class Observer;
class Observers;

/**
 * @class DeferredWorld
 * @brief Restricted World access for hooks, clone behaviours and observer
 *        callbacks.
 *
 * Existing components may be read and mutated and the observer index may
 * be updated, but nothing here spawns, despawns, inserts or removes.
 * Structural changes go through commands() and run at the next flush.
 */
class DeferredWorld final
{
public:
    explicit DeferredWorld(World& world) noexcept : _world{world} {}

    [[nodiscard]] bool isAlive(EntityId entity) const noexcept;
    [[nodiscard]] bool has(EntityId entity, ComponentId component) const noexcept;

    /** @brief Back-reference record of a live entity, or nullptr. */
    [[nodiscard]] const ObservedBy* observedBy(EntityId entity) const noexcept;
    [[nodiscard]] ObservedBy*       observedByMut(EntityId entity) noexcept;

    /** @brief Observer component of a live observer entity, or nullptr. */
    [[nodiscard]] const Observer* observer(EntityId entity) const noexcept;
    [[nodiscard]] Observer*       observerMut(EntityId entity) noexcept;

    [[nodiscard]] Observers&         observers() noexcept;
    [[nodiscard]] const WorldConfig& config() const noexcept;

    [[nodiscard]] Commands commands() noexcept;

private:
    World& _world;
};

} // namespace vgl::ecs

#endif // VGL_ECS_DEFERREDWORLD_HPP
