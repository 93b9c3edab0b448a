/**
 * @file Observer.hpp
 * @brief Observer component: a standing event registration stored on its
 *        own entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_OBSERVER_OBSERVER_HPP
    #define VGL_ECS_OBSERVER_OBSERVER_HPP

#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/Entity.hpp>
#include <vgl/ecs/Hooks.hpp>
#include <vgl/core/Types.hpp>

#include <functional>
#include <vector>

namespace vgl::ecs {

class DeferredWorld;

/**
 * @struct Trigger
 * @brief One event occurrence as seen by a single observer.
 */
struct Trigger
{
    EventId     event{};
    EntityId    target{};
    EntityId    observer{};
    ComponentId component{ComponentId::None};
};

/** @brief Reaction run when a matching event is triggered. */
using ObserverCallback = std::function<void(const Trigger&, DeferredWorld&)>;

/**
 * @struct ObserverDescriptor
 * @brief What an observer watches.
 *
 * - @c entities   : watched subjects; empty means "any entity".
 * - @c components : component kinds the observer is scoped to; empty
 *                   means a whole-entity observer.
 * - @c events     : event kinds the observer reacts to.
 */
struct ObserverDescriptor
{
    std::vector<EntityId>    entities;
    std::vector<ComponentId> components;
    std::vector<EventId>     events;

    /** @brief Adds a subject unless already present. */
    ObserverDescriptor& withEntity(EntityId entity);
    ObserverDescriptor& withComponent(ComponentId component);
    ObserverDescriptor& withEvent(EventId event);
};

/**
 * @class Observer
 * @brief Component held by an observer entity.
 *
 * Tracks how many of the descriptor's subjects have already been
 * despawned; once every subject is gone the observer despawns itself.
 * Invariant: 0 <= despawnedWatched() <= descriptor().entities.size().
 */
class Observer final
{
public:
    explicit Observer(ObserverCallback callback, ObserverDescriptor descriptor = {});

    [[nodiscard]] const ObserverDescriptor& descriptor() const noexcept { return _descriptor; }
    [[nodiscard]] core::u32 despawnedWatched() const noexcept { return _despawnedWatched; }

    /** @brief Number of subjects that are still alive. */
    [[nodiscard]] core::usize liveWatched() const noexcept;

    /** @brief Runs the reaction, if any. */
    void run(const Trigger& trigger, DeferredWorld& world) const;

    /**
     * @brief Removal hook: unregisters the observer from the global index
     *        and from the back-reference of every subject still alive.
     */
    static void onRemove(DeferredWorld& world, HookContext ctx);

private:
    friend class ObservedBy;

    ObserverDescriptor _descriptor;
    ObserverCallback   _callback;
    core::u32          _despawnedWatched{0};
};

} // namespace vgl::ecs

#endif // VGL_ECS_OBSERVER_OBSERVER_HPP
