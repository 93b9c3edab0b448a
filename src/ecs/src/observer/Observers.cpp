/**
 * @file Observers.cpp
 * @brief Global observer index maintenance.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/observer/Observers.hpp>
#include <vgl/ecs/observer/Observer.hpp>

namespace vgl::ecs {

namespace {

void eraseFrom(EntityObserverMap& map, EntityId key, EntityId observer)
{
    auto it = map.find(key);
    if (it == map.end())
    {
        return;
    }
    it->second.erase(observer);
    if (it->second.empty())
    {
        map.erase(it);
    }
}

} // anonymous namespace

bool CachedObservers::empty() const noexcept
{
    return globalObservers.empty() && entityObservers.empty() && componentObservers.empty();
}

const CachedObservers* Observers::get(EventId event) const
{
    auto it = _cache.find(event);
    return it == _cache.end() ? nullptr : &it->second;
}

CachedObservers& Observers::getMut(EventId event)
{
    return _cache[event];
}

void Observers::registerObserver(EntityId observer, const ObserverDescriptor& descriptor)
{
    for (const EventId event : descriptor.events)
    {
        CachedObservers& cached = _cache[event];

        if (descriptor.components.empty())
        {
            if (descriptor.entities.empty())
            {
                cached.globalObservers.insert(observer);
                continue;
            }
            for (const EntityId watched : descriptor.entities)
            {
                cached.entityObservers[watched].insert(observer);
            }
            continue;
        }

        for (const ComponentId component : descriptor.components)
        {
            CachedComponentObservers& scoped = cached.componentObservers[component];
            if (descriptor.entities.empty())
            {
                scoped.globalObservers.insert(observer);
                continue;
            }
            for (const EntityId watched : descriptor.entities)
            {
                scoped.entityComponentObservers[watched].insert(observer);
            }
        }
    }
}

void Observers::unregisterObserver(EntityId observer, const ObserverDescriptor& descriptor)
{
    for (const EventId event : descriptor.events)
    {
        auto cit = _cache.find(event);
        if (cit == _cache.end())
        {
            continue;
        }
        CachedObservers& cached = cit->second;

        if (descriptor.components.empty())
        {
            if (descriptor.entities.empty())
            {
                cached.globalObservers.erase(observer);
            }
            for (const EntityId watched : descriptor.entities)
            {
                eraseFrom(cached.entityObservers, watched, observer);
            }
        }
        else
        {
            for (const ComponentId component : descriptor.components)
            {
                auto it = cached.componentObservers.find(component);
                if (it == cached.componentObservers.end())
                {
                    continue;
                }
                if (descriptor.entities.empty())
                {
                    it->second.globalObservers.erase(observer);
                }
                for (const EntityId watched : descriptor.entities)
                {
                    eraseFrom(it->second.entityComponentObservers, watched, observer);
                }
                if (it->second.empty())
                {
                    cached.componentObservers.erase(it);
                }
            }
        }

        if (cached.empty())
        {
            _cache.erase(cit);
        }
    }
}

void Observers::pruneEntity(EntityId watched, const ObserverDescriptor& descriptor)
{
    for (const EventId event : descriptor.events)
    {
        auto cit = _cache.find(event);
        if (cit == _cache.end())
        {
            continue;
        }

        if (descriptor.components.empty())
        {
            cit->second.entityObservers.erase(watched);
            continue;
        }
        for (const ComponentId component : descriptor.components)
        {
            auto it = cit->second.componentObservers.find(component);
            if (it != cit->second.componentObservers.end())
            {
                it->second.entityComponentObservers.erase(watched);
            }
        }
    }
}

bool Observers::references(EntityId watched) const
{
    for (const auto& [event, cached] : _cache)
    {
        if (cached.entityObservers.contains(watched))
        {
            return true;
        }
        for (const auto& [component, scoped] : cached.componentObservers)
        {
            if (scoped.entityComponentObservers.contains(watched))
            {
                return true;
            }
        }
    }
    return false;
}

} // namespace vgl::ecs
