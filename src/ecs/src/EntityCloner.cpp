/**
 * @file EntityCloner.cpp
 * @brief Clone pipeline and the observer propagation switch.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/EntityCloner.hpp>
#include <vgl/ecs/World.hpp>
#include <vgl/ecs/observer/ObservedBy.hpp>
#include <vgl/core/Log.hpp>

#include <utility>
#include <vector>

namespace vgl::ecs {

// ========================================================================== //
//  CloneContext                                                              //
// ========================================================================== //

CloneContext::CloneContext(EntityId source, EntityId target, World& world) noexcept
    : _source{source}
    , _target{target}
    , _deferred{world}
{}

void CloneContext::queueDeferred(Command command)
{
    _deferred.commands().push(std::move(command));
}

// ========================================================================== //
//  Builder                                                                   //
// ========================================================================== //

EntityCloner::Builder& EntityCloner::Builder::addObservers(bool enabled)
{
    if (enabled)
    {
        return overrideCloneBehavior(ComponentId::ObservedBy,
                                     ComponentCloneBehavior::custom(&ObservedBy::cloneWithObservers));
    }
    return removeCloneBehaviorOverride(ComponentId::ObservedBy);
}

EntityCloner::Builder& EntityCloner::Builder::overrideCloneBehavior(
    ComponentId component, ComponentCloneBehavior behavior)
{
    _overrides.insert_or_assign(component, behavior);
    return *this;
}

EntityCloner::Builder& EntityCloner::Builder::removeCloneBehaviorOverride(ComponentId component)
{
    _overrides.erase(component);
    return *this;
}

EntityCloner EntityCloner::Builder::finish() const
{
    return EntityCloner{_world, _overrides};
}

core::Expected<void> EntityCloner::Builder::cloneEntity(EntityId source, EntityId target) const
{
    return finish().cloneEntity(source, target);
}

// ========================================================================== //
//  EntityCloner                                                              //
// ========================================================================== //

EntityCloner::EntityCloner(World& world, Overrides overrides)
    : _world{world}
    , _overrides{std::move(overrides)}
{}

ComponentCloneBehavior EntityCloner::behaviorFor(ComponentId component) const
{
    if (auto it = _overrides.find(component); it != _overrides.end())
    {
        return it->second;
    }
    return isBuiltin(component) ? ComponentCloneBehavior::ignore()
                                : ComponentCloneBehavior::copy();
}

core::Expected<void> EntityCloner::cloneEntity(EntityId source, EntityId target)
{
    if (!_world.isAlive(source) || !_world.isAlive(target))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Clone source or target is not alive");
    }
    if (source == target)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Cannot clone an entity onto itself");
    }

    const std::vector<ComponentId> components = _world.archetype(source)->components();

    for (const ComponentId component : components)
    {
        const ComponentCloneBehavior behavior = behaviorFor(component);
        switch (behavior.kind)
        {
            case ComponentCloneBehavior::Kind::Ignore:
                break;

            case ComponentCloneBehavior::Kind::Copy:
                if (!isBuiltin(component))
                {
                    VGL_TRY_VOID(_world.insert(target, component));
                }
                break;

            case ComponentCloneBehavior::Kind::Custom:
                if (behavior.fn != nullptr)
                {
                    CloneContext ctx{source, target, _world};
                    behavior.fn(ctx);
                }
                break;
        }
    }

    core::Log::debug(core::LogTag::kEcs, "EntityCloner: clone applied, flushing deferred work");
    _world.flush();
    return {};
}

} // namespace vgl::ecs
