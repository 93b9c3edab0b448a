/**
 * @file Observer.cpp
 * @brief Observer descriptor helpers and the observer removal hook.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/observer/Observer.hpp>
#include <vgl/ecs/observer/ObservedBy.hpp>
#include <vgl/ecs/observer/Observers.hpp>
#include <vgl/ecs/DeferredWorld.hpp>
#include <vgl/core/Assert.hpp>
#include <vgl/core/Log.hpp>

#include <algorithm>
#include <utility>

namespace vgl::ecs {

namespace {

template <typename T>
void pushUnique(std::vector<T>& values, T value)
{
    if (std::find(values.begin(), values.end(), value) == values.end())
    {
        values.push_back(value);
    }
}

} // anonymous namespace

// ========================================================================== //
//  ObserverDescriptor                                                        //
// ========================================================================== //

ObserverDescriptor& ObserverDescriptor::withEntity(EntityId entity)
{
    pushUnique(entities, entity);
    return *this;
}

ObserverDescriptor& ObserverDescriptor::withComponent(ComponentId component)
{
    pushUnique(components, component);
    return *this;
}

ObserverDescriptor& ObserverDescriptor::withEvent(EventId event)
{
    pushUnique(events, event);
    return *this;
}

// ========================================================================== //
//  Observer                                                                  //
// ========================================================================== //

Observer::Observer(ObserverCallback callback, ObserverDescriptor descriptor)
    : _descriptor{std::move(descriptor)}
    , _callback{std::move(callback)}
{}

core::usize Observer::liveWatched() const noexcept
{
    return _descriptor.entities.size() - _despawnedWatched;
}

void Observer::run(const Trigger& trigger, DeferredWorld& world) const
{
    if (_callback)
    {
        _callback(trigger, world);
    }
}

void Observer::onRemove(DeferredWorld& world, HookContext ctx)
{
    const Observer* state = world.observer(ctx.entity);
    VGL_VERIFY(state != nullptr, "entity losing Observer must hold an Observer");

    world.observers().unregisterObserver(ctx.entity, state->_descriptor);

    for (const EntityId watched : state->_descriptor.entities)
    {
        // Subjects already despawned have no record left to update.
        if (ObservedBy* record = world.observedByMut(watched))
        {
            record->erase(ctx.entity);
        }
    }

    core::Log::debug(core::LogTag::kObs, "observer unregistered");
}

} // namespace vgl::ecs
