/**
 * @file ObservedBy.hpp
 * @brief Back-reference record kept on a watched entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_OBSERVER_OBSERVEDBY_HPP
    #define VGL_ECS_OBSERVER_OBSERVEDBY_HPP

#include <vgl/ecs/Entity.hpp>
#include <vgl/ecs/Hooks.hpp>
#include <vgl/core/Types.hpp>

#include <span>
#include <utility>
#include <vector>

namespace vgl::ecs {

class CloneContext;

/**
 * @class ObservedBy
 * @brief Observers currently watching the owning entity, in registration
 *        order.
 *
 * Symmetric with ObserverDescriptor::entities: an observer is listed here
 * if and only if it lists the owning entity as a subject.  Only the
 * registration path appends, and only the despawn cascade drains.
 */
class ObservedBy final
{
public:
    ObservedBy() = default;

    /** @brief Read-only view of the observers watching this entity. */
    [[nodiscard]] std::span<const EntityId> get() const noexcept { return _observers; }

    [[nodiscard]] core::usize size()  const noexcept { return _observers.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _observers.empty(); }
    [[nodiscard]] bool        contains(EntityId observer) const noexcept;

    /**
     * @brief Removal hook running the despawn cascade.
     *
     * Takes the observer list, counts the loss on every observer still
     * alive, and enqueues a despawn of each observer left without a live
     * subject.
     */
    static void onRemove(DeferredWorld& world, HookContext ctx);

    /**
     * @brief Clone behaviour installed by EntityCloner::Builder::addObservers.
     *
     * Enqueues one deferred unit that extends every observer of the source
     * to the clone target.
     */
    static void cloneWithObservers(CloneContext& ctx);

private:
    friend class World;
    friend class Observer;

    explicit ObservedBy(std::vector<EntityId> observers) : _observers{std::move(observers)} {}

    void push(EntityId observer);
    bool erase(EntityId observer);
    [[nodiscard]] std::vector<EntityId> take() noexcept;

    std::vector<EntityId> _observers;
};

} // namespace vgl::ecs

#endif // VGL_ECS_OBSERVER_OBSERVEDBY_HPP
