/**
 * @file DeferredWorld.cpp
 * @brief Forwarding of the non-structural World surface.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/DeferredWorld.hpp>
#include <vgl/ecs/World.hpp>

namespace vgl::ecs {

bool DeferredWorld::isAlive(EntityId entity) const noexcept
{
    return _world.isAlive(entity);
}

bool DeferredWorld::has(EntityId entity, ComponentId component) const noexcept
{
    return _world.has(entity, component);
}

const ObservedBy* DeferredWorld::observedBy(EntityId entity) const noexcept
{
    return _world.observedBy(entity);
}

ObservedBy* DeferredWorld::observedByMut(EntityId entity) noexcept
{
    return _world.observedByMut(entity);
}

const Observer* DeferredWorld::observer(EntityId entity) const noexcept
{
    return _world.observer(entity);
}

Observer* DeferredWorld::observerMut(EntityId entity) noexcept
{
    return _world.observerMut(entity);
}

Observers& DeferredWorld::observers() noexcept
{
    return _world.observers();
}

const WorldConfig& DeferredWorld::config() const noexcept
{
    return _world.config();
}

Commands DeferredWorld::commands() noexcept
{
    return _world.commands();
}

} // namespace vgl::ecs
