/**
 * @file Observers.hpp
 * @brief World-wide index from event kind to the observers to run.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_OBSERVER_OBSERVERS_HPP
    #define VGL_ECS_OBSERVER_OBSERVERS_HPP

#include <vgl/ecs/Component.hpp>
#include <vgl/ecs/Entity.hpp>
#include <vgl/core/NonCopyable.hpp>
#include <vgl/core/Types.hpp>

#include <unordered_map>
#include <unordered_set>

namespace vgl::ecs {

struct ObserverDescriptor;

/** @brief Observer entities of one bucket. Copies are independent snapshots. */
using ObserverSet = std::unordered_set<EntityId>;

/** @brief Watched entity → observers registered for it. */
using EntityObserverMap = std::unordered_map<EntityId, ObserverSet>;

/**
 * @struct CachedComponentObservers
 * @brief Observers of one event kind scoped to one component kind.
 */
struct CachedComponentObservers
{
    /** @brief Scoped to the component on any entity. */
    ObserverSet       globalObservers;
    /** @brief Scoped to the component on a specific entity. */
    EntityObserverMap entityComponentObservers;

    [[nodiscard]] bool empty() const noexcept
    {
        return globalObservers.empty() && entityComponentObservers.empty();
    }
};

/**
 * @struct CachedObservers
 * @brief Every observer of one event kind, bucketed for dispatch.
 */
struct CachedObservers
{
    /** @brief No subject, no component scope: run on every occurrence. */
    ObserverSet       globalObservers;
    /** @brief Whole-entity observers keyed by watched entity. */
    EntityObserverMap entityObservers;
    /** @brief Component-scoped observers keyed by component kind. */
    std::unordered_map<ComponentId, CachedComponentObservers> componentObservers;

    [[nodiscard]] bool empty() const noexcept;
};

/**
 * @class Observers
 * @brief One CachedObservers per event kind.
 *
 * Owned by the World.  Mutated by the registration path, the observer
 * removal hook, the despawn cascade and clone propagation, always under
 * the world's single-writer discipline.
 */
class Observers final : public core::NonCopyable
{
public:
    Observers() = default;

    /** @brief Bucket of @p event, or nullptr when nothing ever registered for it. */
    [[nodiscard]] const CachedObservers* get(EventId event) const;

    /** @brief Bucket of @p event, created on demand. */
    [[nodiscard]] CachedObservers& getMut(EventId event);

    /** @brief Adds @p observer to every bucket its descriptor selects. */
    void registerObserver(EntityId observer, const ObserverDescriptor& descriptor);

    /** @brief Removes @p observer from every bucket its descriptor selects. */
    void unregisterObserver(EntityId observer, const ObserverDescriptor& descriptor);

    /**
     * @brief Erases the entries keyed by @p watched in the buckets selected
     *        by @p descriptor's events and components.
     */
    void pruneEntity(EntityId watched, const ObserverDescriptor& descriptor);

    /** @brief Tests whether any bucket of any event still has a key @p watched. */
    [[nodiscard]] bool references(EntityId watched) const;

    [[nodiscard]] core::usize eventCount() const noexcept { return _cache.size(); }

private:
    std::unordered_map<EventId, CachedObservers> _cache;
};

} // namespace vgl::ecs

#endif // VGL_ECS_OBSERVER_OBSERVERS_HPP
