/**
 * @file Registry.hpp
 * @brief Entity registry: creates and validates entity handles.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef VGL_ECS_REGISTRY_HPP
    #define VGL_ECS_REGISTRY_HPP

#include <vgl/ecs/Archetype.hpp>
#include <vgl/ecs/Entity.hpp>
#include <vgl/core/Constants.hpp>
#include <vgl/core/Expected.hpp>
#include <vgl/core/NonCopyable.hpp>
#include <vgl/core/Types.hpp>

#include <memory>

namespace vgl::ecs {

/**
 * @class Registry
 * @brief Owns the entity free-list, generation table and the per-entity
 *        archetype.
 *
 * Entities are created with a unique slot + generation. On destruction the
 * slot is recycled and the generation is bumped, invalidating stale
 * EntityIds.  A slot destroyed at its last generation is retired instead,
 * so no EntityId is ever issued twice.  Single-writer: the owning World
 * serialises every call.
 */
class Registry final : public core::NonCopyable
{
public:
    /**
     * @brief Constructs an empty registry.
     * @param initialCapacity Number of slots reserved up front.
     */
    explicit Registry(core::u32 initialCapacity = core::kDefaultInitialCapacity);
    ~Registry();

    Registry(Registry&&) noexcept;
    Registry& operator=(Registry&&) noexcept;

    // --------------------------------------------------------------------- //
    //  Entity lifecycle                                                      //
    // --------------------------------------------------------------------- //

    /**
     * @brief Creates a new entity with the given archetype.
     * @return Entity identifier on success, or error on slot exhaustion.
     */
    [[nodiscard]] core::Expected<EntityId> create(const Archetype& archetype = {});

    /**
     * @brief Destroys an entity, recycling its slot.
     * @return OK on success, or error if the entity is already dead.
     */
    [[nodiscard]] core::Expected<void> destroy(EntityId id);

    /** @brief Tests whether an entity is alive (generation matches). */
    [[nodiscard]] bool isAlive(EntityId id) const noexcept;

    /** @brief Returns the total number of live entities. */
    [[nodiscard]] core::u32 liveCount() const noexcept;

    /** @brief Number of slots taken out of circulation after their last generation. */
    [[nodiscard]] core::u32 retiredCount() const noexcept;

    // --------------------------------------------------------------------- //
    //  Archetype                                                             //
    // --------------------------------------------------------------------- //

    /**
     * @brief Returns the archetype of a live entity.
     * @return Pointer into the slot table, or nullptr if @p id is dead.
     */
    [[nodiscard]] Archetype*       archetype(EntityId id) noexcept;
    [[nodiscard]] const Archetype* archetype(EntityId id) const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace vgl::ecs

#endif // VGL_ECS_REGISTRY_HPP
