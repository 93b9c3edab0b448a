/**
 * @file World.hpp
 * @brief Owning entity runtime: registry, observer storage, observer
 *        index, component hooks and the deferred command queue.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_WORLD_HPP
    #define VGL_ECS_WORLD_HPP

#include <vgl/ecs/Archetype.hpp>
#include <vgl/ecs/CommandQueue.hpp>
#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/DeferredWorld.hpp>
#include <vgl/ecs/Entity.hpp>
#include <vgl/ecs/Hooks.hpp>
#include <vgl/ecs/WorldConfig.hpp>
#include <vgl/ecs/observer/Observer.hpp>
#include <vgl/core/Expected.hpp>
#include <vgl/core/NonCopyable.hpp>
#include <vgl/core/Types.hpp>

#include <memory>
#include <span>

namespace vgl::ecs {

class ObservedBy;
class Observers;

/**
 * @class World
 * @brief Single-writer entity world.
 *
 * Every structural operation (spawn, despawn, insert, remove, clone) runs
 * to completion before the next one starts.  Removal hooks fire
 * synchronously, while the entity's components are still present, and may
 * only enqueue further structural work; the queue is flushed at the end of
 * the operation that triggered it.  Flushing is not reentrant: commands
 * enqueued while draining are picked up by the same drain, in FIFO order.
 */
class World final : public core::Pinned
{
public:
    World();
    explicit World(const WorldConfig& config);
    ~World();

    // --------------------------------------------------------------------- //
    //  Entity lifecycle                                                      //
    // --------------------------------------------------------------------- //

    /** @brief Spawns an entity with no components. */
    [[nodiscard]] core::Expected<EntityId> spawn();

    /**
     * @brief Spawns an entity carrying the application kinds of @p archetype.
     * @return Error if the archetype names a reserved kind.
     */
    [[nodiscard]] core::Expected<EntityId> spawn(const Archetype& archetype);

    /**
     * @brief Despawns a live entity.
     *
     * Runs the removal hook of every component it holds, erases its
     * components, recycles its id, then flushes the command queue.
     * @return Error if @p entity is not alive.
     */
    [[nodiscard]] core::Expected<void> despawn(EntityId entity);

    /**
     * @brief Adds an application component kind to a live entity.
     * @return Error if the entity is dead or the kind is reserved.
     */
    [[nodiscard]] core::Expected<void> insert(EntityId entity, ComponentId component);

    /**
     * @brief Removes an application component kind, running its removal
     *        hook first.  Removing an absent kind is a no-op.
     */
    [[nodiscard]] core::Expected<void> remove(EntityId entity, ComponentId component);

    [[nodiscard]] bool      isAlive(EntityId entity) const noexcept;
    [[nodiscard]] bool      has(EntityId entity, ComponentId component) const noexcept;
    [[nodiscard]] core::u32 liveCount() const noexcept;

    /** @brief Archetype of a live entity, or nullptr. */
    [[nodiscard]] const Archetype* archetype(EntityId entity) const noexcept;

    // --------------------------------------------------------------------- //
    //  Hooks                                                                 //
    // --------------------------------------------------------------------- //

    /**
     * @brief Installs the removal hook of an application component kind.
     * @param hook nullptr clears it.
     * @return Error for reserved kinds, whose hooks are fixed.
     */
    [[nodiscard]] core::Expected<void> setOnRemoveHook(ComponentId component, ComponentHook hook);

    // --------------------------------------------------------------------- //
    //  Observers                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Spawns an observer entity and registers it.
     *
     * Adds it to the global index for every event of its descriptor and to
     * the back-reference of every subject.
     * @return Error if a subject is not alive; nothing is spawned then.
     */
    [[nodiscard]] core::Expected<EntityId> spawnObserver(Observer observer);

    /** @brief Registers @p callback on @p subject in addition to @p descriptor's subjects. */
    [[nodiscard]] core::Expected<EntityId> observe(
        EntityId subject, ObserverDescriptor descriptor, ObserverCallback callback);

    /** @brief Back-reference record of a live entity, or nullptr. */
    [[nodiscard]] const ObservedBy* observedBy(EntityId entity) const noexcept;

    /** @brief Observer component of a live observer entity, or nullptr. */
    [[nodiscard]] const Observer* observer(EntityId entity) const noexcept;

    [[nodiscard]] Observers&       observers() noexcept;
    [[nodiscard]] const Observers& observers() const noexcept;

    /**
     * @brief Runs the observers of @p event for @p target, then flushes.
     *
     * Invokes the event's global observers, the whole-entity observers of
     * a live @p target, and for every listed component its global and
     * per-entity observers.  Index entries whose observer is gone are
     * skipped.
     */
    void trigger(EventId event, EntityId target);
    void trigger(EventId event, EntityId target, std::span<const ComponentId> components);

    // --------------------------------------------------------------------- //
    //  Deferred work                                                         //
    // --------------------------------------------------------------------- //

    [[nodiscard]] Commands      commands() noexcept;
    [[nodiscard]] DeferredWorld deferred() noexcept { return DeferredWorld{*this}; }

    /** @brief Runs every pending command in FIFO order. */
    void flush();

    /** @brief Number of commands waiting for the next flush. */
    [[nodiscard]] core::usize pendingCommands() const noexcept;

    [[nodiscard]] const WorldConfig& config() const noexcept;

private:
    friend class DeferredWorld;
    friend class ObservedBy;

    [[nodiscard]] ObservedBy* observedByMut(EntityId entity) noexcept;
    [[nodiscard]] Observer*   observerMut(EntityId entity) noexcept;

    /** @brief Stores @p record on a live entity that has none. */
    void attachObservedBy(EntityId entity, ObservedBy record);

    void runRemoveHooks(EntityId entity, std::span<const ComponentId> components);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vgl::ecs

#endif // VGL_ECS_WORLD_HPP
