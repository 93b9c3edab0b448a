/**
 * @file Archetype.inl
 * @brief Inline implementations for Archetype.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_ARCHETYPE_INL
    #define VGL_ECS_ARCHETYPE_INL

namespace vgl::ecs {

inline Archetype::Archetype(std::initializer_list<ComponentId> ids) noexcept
{
    for (auto id : ids)
    {
        add(id);
    }
}

inline void Archetype::add(ComponentId id) noexcept
{
    if (isStorable(id))
    {
        _mask.set(static_cast<core::usize>(id));
    }
}

inline void Archetype::remove(ComponentId id) noexcept
{
    if (isStorable(id))
    {
        _mask.reset(static_cast<core::usize>(id));
    }
}

inline bool Archetype::has(ComponentId id) const noexcept
{
    return isStorable(id) && _mask.test(static_cast<core::usize>(id));
}

inline std::vector<ComponentId> Archetype::components() const
{
    std::vector<ComponentId> out;
    out.reserve(_mask.count());
    for (core::usize i = 0; i < kMaxComponents; ++i)
    {
        if (_mask.test(i))
        {
            out.push_back(static_cast<ComponentId>(i));
        }
    }
    return out;
}

inline core::usize Archetype::count() const noexcept
{
    return _mask.count();
}

inline bool Archetype::operator==(const Archetype& other) const noexcept
{
    return _mask == other._mask;
}

} // namespace vgl::ecs

#endif // VGL_ECS_ARCHETYPE_INL
