/**
 * @file ObservedBy.cpp
 * @brief Back-reference record: despawn cascade and clone propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/observer/ObservedBy.hpp>
#include <vgl/ecs/observer/Observer.hpp>
#include <vgl/ecs/observer/Observers.hpp>
#include <vgl/ecs/DeferredWorld.hpp>
#include <vgl/ecs/EntityCloner.hpp>
#include <vgl/ecs/World.hpp>
#include <vgl/core/Assert.hpp>
#include <vgl/core/Log.hpp>

#include <algorithm>
#include <utility>

namespace vgl::ecs {

namespace {

/** @brief Merges the observers keyed by @p source into the entry keyed by @p target. */
void copyBucket(EntityObserverMap& map, EntityId source, EntityId target)
{
    auto it = map.find(source);
    if (it == map.end())
    {
        return;
    }
    ObserverSet snapshot = it->second;
    map[target].merge(snapshot);
}

} // anonymous namespace

bool ObservedBy::contains(EntityId observer) const noexcept
{
    return std::find(_observers.begin(), _observers.end(), observer) != _observers.end();
}

void ObservedBy::push(EntityId observer)
{
    _observers.push_back(observer);
}

bool ObservedBy::erase(EntityId observer)
{
    auto it = std::find(_observers.begin(), _observers.end(), observer);
    if (it == _observers.end())
    {
        return false;
    }
    _observers.erase(it);
    return true;
}

std::vector<EntityId> ObservedBy::take() noexcept
{
    return std::exchange(_observers, {});
}

// ========================================================================== //
//  Despawn cascade                                                           //
// ========================================================================== //

void ObservedBy::onRemove(DeferredWorld& world, HookContext ctx)
{
    ObservedBy* record = world.observedByMut(ctx.entity);
    VGL_VERIFY(record != nullptr, "entity losing ObservedBy must hold an ObservedBy");

    // Taken, not copied: a second run over the same entity finds nothing.
    const std::vector<EntityId> watchers = record->take();
    const bool prune = world.config().pruneStaleIndex();

    for (const EntityId observerId : watchers)
    {
        Observer* state = world.observerMut(observerId);
        if (state == nullptr)
        {
            core::Log::debug(core::LogTag::kObs, "cascade: observer already gone, skipped");
            continue;
        }

        ++state->_despawnedWatched;
        const auto total = state->_descriptor.entities.size();
        VGL_VERIFY(state->_despawnedWatched <= total, "observer lost more subjects than it watches");

        if (prune)
        {
            world.observers().pruneEntity(ctx.entity, state->_descriptor);
        }

        if (state->_despawnedWatched == total)
        {
            core::Log::debug(core::LogTag::kObs, "cascade: last subject gone, observer despawn enqueued");
            world.commands().despawn(observerId);
        }
    }
}

// ========================================================================== //
//  Clone propagation                                                         //
// ========================================================================== //

void ObservedBy::cloneWithObservers(CloneContext& ctx)
{
    const EntityId source = ctx.source();
    const EntityId target = ctx.target();

    ctx.queueDeferred([source, target](World& world) {
        if (!world.isAlive(source) || !world.isAlive(target))
        {
            core::Log::warn(core::LogTag::kObs, "clone propagation skipped: source or target no longer alive");
            return;
        }

        const ObservedBy* sourceRecord = world.observedBy(source);
        VGL_VERIFY(sourceRecord != nullptr, "clone source must hold an ObservedBy");
        const std::vector<EntityId> watchers(sourceRecord->get().begin(), sourceRecord->get().end());

        // A target already watched keeps its own observers; only new ones are added.
        std::vector<EntityId> added;
        added.reserve(watchers.size());
        if (ObservedBy* targetRecord = world.observedByMut(target))
        {
            for (const EntityId observerId : watchers)
            {
                if (!targetRecord->contains(observerId))
                {
                    targetRecord->push(observerId);
                    added.push_back(observerId);
                }
            }
        }
        else
        {
            world.attachObservedBy(target, ObservedBy{watchers});
            added = watchers;
        }

        DeferredWorld view = world.deferred();
        for (const EntityId observerId : added)
        {
            Observer* state = view.observerMut(observerId);
            VGL_VERIFY(state != nullptr, "observer listed in ObservedBy must hold an Observer");

            // New subject is alive: despawnedWatched is left untouched.
            state->_descriptor.entities.push_back(target);

            const ObserverDescriptor& descriptor = state->_descriptor;
            for (const EventId event : descriptor.events)
            {
                CachedObservers& cached = view.observers().getMut(event);
                if (descriptor.components.empty())
                {
                    copyBucket(cached.entityObservers, source, target);
                    continue;
                }
                for (const ComponentId component : descriptor.components)
                {
                    auto it = cached.componentObservers.find(component);
                    if (it == cached.componentObservers.end())
                    {
                        continue;
                    }
                    copyBucket(it->second.entityComponentObservers, source, target);
                }
            }
        }

        core::Log::debug(core::LogTag::kObs, "clone propagation applied");
    });
}

} // namespace vgl::ecs
