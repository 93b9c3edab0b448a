/**
 * @file World.cpp
 * @brief World storage, structural operations and flush discipline.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/World.hpp>
#include <vgl/ecs/Registry.hpp>
#include <vgl/ecs/observer/ObservedBy.hpp>
#include <vgl/ecs/observer/Observers.hpp>
#include <vgl/container/SparseSet.hpp>
#include <vgl/core/Assert.hpp>
#include <vgl/core/Log.hpp>

#include <array>
#include <utility>
#include <vector>

namespace vgl::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct World::Impl
{
    WorldConfig                                  config;
    Registry                                     registry;
    container::SparseSet<EntityId, ObservedBy>   observedBy;
    container::SparseSet<EntityId, Observer>     observers;
    Observers                                    index;
    CommandQueue                                 commands;
    std::array<ComponentHook, Archetype::kMaxComponents> onRemove{};
    bool                                         flushing{false};

    explicit Impl(const WorldConfig& cfg)
        : config{cfg}
        , registry{cfg.initialCapacity()}
    {
        onRemove[static_cast<core::usize>(ComponentId::ObservedBy)] = &ObservedBy::onRemove;
        onRemove[static_cast<core::usize>(ComponentId::Observer)]   = &Observer::onRemove;
    }
};

namespace {

/** @brief Clears the flushing flag even if a command throws. */
class FlushGuard final
{
public:
    explicit FlushGuard(bool& flag) noexcept : _flag{flag} { _flag = true; }
    ~FlushGuard() { _flag = false; }

    FlushGuard(const FlushGuard&)            = delete;
    FlushGuard& operator=(const FlushGuard&) = delete;

private:
    bool& _flag;
};

} // anonymous namespace

// ========================================================================== //
//  Construction                                                              //
// ========================================================================== //

World::World()
    : World{WorldConfig::Builder{}.build()}
{}

World::World(const WorldConfig& config)
    : _impl{std::make_unique<Impl>(config)}
{
    if (const auto level = config.logLevel())
    {
        core::Log::setMinLevel(*level);
    }
}

World::~World() = default;

// ========================================================================== //
//  Entity lifecycle                                                          //
// ========================================================================== //

core::Expected<EntityId> World::spawn()
{
    return _impl->registry.create();
}

core::Expected<EntityId> World::spawn(const Archetype& archetype)
{
    if (archetype.has(ComponentId::ObservedBy) || archetype.has(ComponentId::Observer))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "Observer components cannot be spawned from an archetype");
    }
    return _impl->registry.create(archetype);
}

core::Expected<void> World::despawn(EntityId entity)
{
    const Archetype* arch = _impl->registry.archetype(entity);
    if (arch == nullptr)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Cannot despawn a dead entity");
    }

    const std::vector<ComponentId> components = arch->components();
    runRemoveHooks(entity, components);

    _impl->observedBy.remove(entity);
    _impl->observers.remove(entity);
    VGL_TRY_VOID(_impl->registry.destroy(entity));

    flush();
    return {};
}

core::Expected<void> World::insert(EntityId entity, ComponentId component)
{
    if (isBuiltin(component) || !isStorable(component))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Component kind cannot be inserted directly");
    }
    Archetype* arch = _impl->registry.archetype(entity);
    if (arch == nullptr)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Cannot insert into a dead entity");
    }
    arch->add(component);
    return {};
}

core::Expected<void> World::remove(EntityId entity, ComponentId component)
{
    if (isBuiltin(component) || !isStorable(component))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Component kind cannot be removed directly");
    }
    if (!isAlive(entity))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Cannot remove from a dead entity");
    }
    if (!has(entity, component))
    {
        return {};
    }

    const ComponentId single[] = {component};
    runRemoveHooks(entity, single);

    // The hook cannot despawn inline, so the entity is still alive here.
    _impl->registry.archetype(entity)->remove(component);
    flush();
    return {};
}

bool World::isAlive(EntityId entity) const noexcept
{
    return _impl->registry.isAlive(entity);
}

bool World::has(EntityId entity, ComponentId component) const noexcept
{
    const Archetype* arch = _impl->registry.archetype(entity);
    return arch != nullptr && arch->has(component);
}

core::u32 World::liveCount() const noexcept
{
    return _impl->registry.liveCount();
}

const Archetype* World::archetype(EntityId entity) const noexcept
{
    return _impl->registry.archetype(entity);
}

// ========================================================================== //
//  Hooks                                                                     //
// ========================================================================== //

core::Expected<void> World::setOnRemoveHook(ComponentId component, ComponentHook hook)
{
    if (isBuiltin(component) || !isStorable(component))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Hooks of reserved kinds are fixed");
    }
    _impl->onRemove[static_cast<core::usize>(component)] = hook;
    return {};
}

void World::runRemoveHooks(EntityId entity, std::span<const ComponentId> components)
{
    DeferredWorld view{*this};
    for (const ComponentId component : components)
    {
        const ComponentHook hook = _impl->onRemove[static_cast<core::usize>(component)];
        if (hook != nullptr)
        {
            hook(view, HookContext{entity, component});
        }
    }
}

// ========================================================================== //
//  Observers                                                                 //
// ========================================================================== //

core::Expected<EntityId> World::spawnObserver(Observer observer)
{
    const ObserverDescriptor& descriptor = observer.descriptor();
    for (const EntityId subject : descriptor.entities)
    {
        if (!isAlive(subject))
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "Observer subject is not alive");
        }
    }

    const EntityId id = VGL_TRY(_impl->registry.create(Archetype{ComponentId::Observer}));

    // The descriptor is read back from storage: `observer` is moved-from.
    const bool stored = _impl->observers.insert(id, std::move(observer));
    VGL_VERIFY(stored, "freshly spawned entity already holds an Observer");
    const ObserverDescriptor& registered = _impl->observers.find(id)->descriptor();

    _impl->index.registerObserver(id, registered);

    for (const EntityId subject : registered.entities)
    {
        ObservedBy* record = _impl->observedBy.find(subject);
        if (record == nullptr)
        {
            attachObservedBy(subject, ObservedBy{});
            record = _impl->observedBy.find(subject);
        }
        record->push(id);
    }

    core::Log::debug(core::LogTag::kObs, "observer registered");
    return id;
}

core::Expected<EntityId> World::observe(
    EntityId subject, ObserverDescriptor descriptor, ObserverCallback callback)
{
    descriptor.withEntity(subject);
    return spawnObserver(Observer{std::move(callback), std::move(descriptor)});
}

const ObservedBy* World::observedBy(EntityId entity) const noexcept
{
    return _impl->observedBy.find(entity);
}

const Observer* World::observer(EntityId entity) const noexcept
{
    return _impl->observers.find(entity);
}

ObservedBy* World::observedByMut(EntityId entity) noexcept
{
    return _impl->observedBy.find(entity);
}

Observer* World::observerMut(EntityId entity) noexcept
{
    return _impl->observers.find(entity);
}

void World::attachObservedBy(EntityId entity, ObservedBy record)
{
    Archetype* arch = _impl->registry.archetype(entity);
    VGL_VERIFY(arch != nullptr, "ObservedBy attached to a dead entity");

    const bool stored = _impl->observedBy.insert(entity, std::move(record));
    VGL_VERIFY(stored, "entity already holds an ObservedBy");
    arch->add(ComponentId::ObservedBy);
}

Observers& World::observers() noexcept
{
    return _impl->index;
}

const Observers& World::observers() const noexcept
{
    return _impl->index;
}

void World::trigger(EventId event, EntityId target)
{
    trigger(event, target, {});
}

void World::trigger(EventId event, EntityId target, std::span<const ComponentId> components)
{
    const CachedObservers* cached = _impl->index.get(event);
    if (cached == nullptr)
    {
        return;
    }

    // Snapshot first: reactions may update the index through DeferredWorld.
    std::vector<Trigger> pending;
    const bool targetAlive = isAlive(target);

    for (const EntityId id : cached->globalObservers)
    {
        pending.push_back(Trigger{event, target, id, ComponentId::None});
    }
    if (targetAlive)
    {
        if (auto it = cached->entityObservers.find(target); it != cached->entityObservers.end())
        {
            for (const EntityId id : it->second)
            {
                pending.push_back(Trigger{event, target, id, ComponentId::None});
            }
        }
    }
    for (const ComponentId component : components)
    {
        auto cit = cached->componentObservers.find(component);
        if (cit == cached->componentObservers.end())
        {
            continue;
        }
        for (const EntityId id : cit->second.globalObservers)
        {
            pending.push_back(Trigger{event, target, id, component});
        }
        if (!targetAlive)
        {
            continue;
        }
        const auto& perEntity = cit->second.entityComponentObservers;
        if (auto it = perEntity.find(target); it != perEntity.end())
        {
            for (const EntityId id : it->second)
            {
                pending.push_back(Trigger{event, target, id, component});
            }
        }
    }

    DeferredWorld view{*this};
    for (const Trigger& t : pending)
    {
        const Observer* state = _impl->observers.find(t.observer);
        if (state == nullptr)
        {
            continue;
        }
        state->run(t, view);
    }

    flush();
}

// ========================================================================== //
//  Deferred work                                                             //
// ========================================================================== //

Commands World::commands() noexcept
{
    return Commands{_impl->commands};
}

void World::flush()
{
    if (_impl->flushing)
    {
        return;
    }

    FlushGuard guard{_impl->flushing};
    while (auto command = _impl->commands.pop())
    {
        (*command)(*this);
    }
}

core::usize World::pendingCommands() const noexcept
{
    return _impl->commands.size();
}

const WorldConfig& World::config() const noexcept
{
    return _impl->config;
}

} // namespace vgl::ecs
