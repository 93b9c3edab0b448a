/**
 * @file Archetype.hpp
 * @brief Archetype definition: the set of component kinds of an entity.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_ARCHETYPE_HPP
    #define VGL_ECS_ARCHETYPE_HPP

#include <vgl/ecs/Component.hpp>
#include <vgl/core/Types.hpp>

#include <bitset>
#include <initializer_list>
#include <vector>

namespace vgl::ecs {

/**
 * @class Archetype
 * @brief Fixed-size bitset where bit N corresponds to @c ComponentId(N).
 */
class Archetype final
{
public:
    static constexpr core::usize kMaxComponents =
        static_cast<core::usize>(ComponentId::Count);

    using Mask = std::bitset<kMaxComponents>;

    constexpr Archetype() noexcept = default;

    Archetype(std::initializer_list<ComponentId> ids) noexcept;

    void add(ComponentId id) noexcept;
    void remove(ComponentId id) noexcept;

    [[nodiscard]] bool has(ComponentId id) const noexcept;

    /** @brief Returns the kinds present, in ascending order. */
    [[nodiscard]] std::vector<ComponentId> components() const;

    [[nodiscard]] core::usize count() const noexcept;

    [[nodiscard]] bool operator==(const Archetype& other) const noexcept;

private:
    Mask _mask{};
};

} // namespace vgl::ecs

#include "Archetype.inl"

#endif // VGL_ECS_ARCHETYPE_HPP
