/**
 * @file EntityCloner.hpp
 * @brief Entity duplication pipeline with per-component clone behaviours.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_ENTITYCLONER_HPP
    #define VGL_ECS_ENTITYCLONER_HPP

#include <vgl/ecs/CommandQueue.hpp>
#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/DeferredWorld.hpp>
#include <vgl/ecs/Entity.hpp>
#include <vgl/core/Expected.hpp>
#include <vgl/core/Types.hpp>

#include <unordered_map>

namespace vgl::ecs {

class World;

/**
 * @class CloneContext
 * @brief Extension point handed to a custom clone behaviour.
 *
 * Cloning is itself a structural operation in progress, so a behaviour
 * may only inspect the world and queue work for the flush that ends
 * EntityCloner::cloneEntity.
 */
class CloneContext final
{
public:
    CloneContext(EntityId source, EntityId target, World& world) noexcept;

    [[nodiscard]] EntityId source() const noexcept { return _source; }
    [[nodiscard]] EntityId target() const noexcept { return _target; }

    [[nodiscard]] DeferredWorld& world() noexcept { return _deferred; }

    /** @brief Enqueues @p command to run once the clone has completed. */
    void queueDeferred(Command command);

private:
    EntityId      _source;
    EntityId      _target;
    DeferredWorld _deferred;
};

/** @brief Custom clone behaviour of one component kind. */
using ComponentCloneFn = void (*)(CloneContext& ctx);

/**
 * @struct ComponentCloneBehavior
 * @brief How one component kind is carried onto the clone target.
 */
struct ComponentCloneBehavior
{
    enum class Kind : core::u8
    {
        Ignore, ///< Not cloned.
        Copy,   ///< Kind added to the target (application kinds only).
        Custom  ///< @c fn decides.
    };

    Kind             kind{Kind::Copy};
    ComponentCloneFn fn{nullptr};

    [[nodiscard]] static constexpr ComponentCloneBehavior ignore() noexcept { return {Kind::Ignore, nullptr}; }
    [[nodiscard]] static constexpr ComponentCloneBehavior copy()   noexcept { return {Kind::Copy, nullptr}; }
    [[nodiscard]] static constexpr ComponentCloneBehavior custom(ComponentCloneFn f) noexcept { return {Kind::Custom, f}; }
};

/**
 * @class EntityCloner
 * @brief Copies the components of one entity onto another.
 *
 * Application kinds are copied; ObservedBy and Observer are ignored
 * unless an override says otherwise.  Observers of the source are carried
 * over only when the builder enables addObservers().
 */
class EntityCloner final
{
public:
    using Overrides = std::unordered_map<ComponentId, ComponentCloneBehavior>;

    /**
     * @class Builder
     * @brief Fluent configuration of an EntityCloner bound to a World.
     */
    class Builder
    {
    public:
        explicit Builder(World& world) noexcept : _world{world} {}

        /**
         * @brief Sets whether clones join the observers watching the source.
         *
         * Off by default.  Turning it off again removes the override.
         */
        Builder& addObservers(bool enabled);

        Builder& overrideCloneBehavior(ComponentId component, ComponentCloneBehavior behavior);
        Builder& removeCloneBehaviorOverride(ComponentId component);

        [[nodiscard]] EntityCloner finish() const;

        /** @brief Shorthand for finish().cloneEntity(source, target). */
        [[nodiscard]] core::Expected<void> cloneEntity(EntityId source, EntityId target) const;

    private:
        World&    _world;
        Overrides _overrides;
    };

    [[nodiscard]] static Builder build(World& world) noexcept { return Builder{world}; }

    /**
     * @brief Clones @p source onto the already spawned @p target, then
     *        flushes the world.
     * @return Error if either entity is dead or both are the same.
     */
    [[nodiscard]] core::Expected<void> cloneEntity(EntityId source, EntityId target);

    /** @brief Behaviour applied to @p component, overrides included. */
    [[nodiscard]] ComponentCloneBehavior behaviorFor(ComponentId component) const;

private:
    EntityCloner(World& world, Overrides overrides);

    World&    _world;
    Overrides _overrides;
};

} // namespace vgl::ecs

#endif // VGL_ECS_ENTITYCLONER_HPP
