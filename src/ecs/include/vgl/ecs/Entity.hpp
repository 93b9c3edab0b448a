/**
 * @file Entity.hpp
 * @brief Entity identifier: packed generation + slot index.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_ENTITY_HPP
    #define VGL_ECS_ENTITY_HPP

#include <vgl/core/Types.hpp>
#include <vgl/core/Constants.hpp>

#include <compare>
#include <functional>
#include <limits>

namespace vgl::ecs {

/**
 * @class EntityId
 * @brief Packed 32-bit entity identifier.
 *
 * Layout (MSB → LSB):
 *   [generation : kGenerationBits] [slot : kSlotBits]
 *
 * The generation counter detects stale references after an entity is
 * despawned and its slot is recycled.
 */
class EntityId final
{
public:
    static constexpr core::u32 kGenerationBits = core::kGenerationBits;
    static constexpr core::u32 kSlotBits       = core::kSlotBits;
    static constexpr core::u32 kSlotMask       = (1u << kSlotBits) - 1u;
    static constexpr core::u32 kGenerationMask = (1u << kGenerationBits) - 1u;

    /** @brief Null sentinel. */
    static constexpr core::u32 kNull = std::numeric_limits<core::u32>::max();

    /** @brief Default-constructs a null entity. */
    constexpr EntityId() noexcept = default;

    /**
     * @brief Constructs from a raw packed value.
     * @param raw Packed generation|slot value.
     */
    constexpr explicit EntityId(core::u32 raw) noexcept
        : _raw{raw}
    {}

    /**
     * @brief Constructs from separate generation + slot.
     * @param generation Generation counter.
     * @param slot       Slot index.
     */
    constexpr EntityId(core::u32 generation, core::u32 slot) noexcept
        : _raw{((generation & kGenerationMask) << kSlotBits) | (slot & kSlotMask)}
    {}

    [[nodiscard]] constexpr core::u32 slot() const noexcept
    {
        return _raw & kSlotMask;
    }

    [[nodiscard]] constexpr core::u32 generation() const noexcept
    {
        return (_raw >> kSlotBits) & kGenerationMask;
    }

    [[nodiscard]] constexpr core::u32 raw() const noexcept { return _raw; }

    /** @brief Tests whether the entity is non-null. Says nothing about liveness. */
    [[nodiscard]] constexpr bool isValid() const noexcept
    {
        return _raw != kNull;
    }

    [[nodiscard]] constexpr bool operator==(const EntityId &other) const noexcept = default;
    [[nodiscard]] constexpr auto operator<=>(const EntityId &other) const noexcept = default;

private:
    core::u32 _raw{kNull};
};

} // namespace vgl::ecs

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <>
struct std::hash<vgl::ecs::EntityId>
{
    [[nodiscard]] std::size_t operator()(vgl::ecs::EntityId id) const noexcept
    {
        return std::hash<vgl::core::u32>{}(id.raw());
    }
};

#endif // VGL_ECS_ENTITY_HPP
