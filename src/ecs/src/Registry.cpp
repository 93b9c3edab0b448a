/**
 * @file Registry.cpp
 * @brief Entity registry with an intrusive free-list of recycled slots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <vgl/ecs/Registry.hpp>
#include <vgl/core/Log.hpp>

#include <vector>

namespace vgl::ecs {

// ========================================================================== //
//  Impl: free-list over a slot table                                         //
// ========================================================================== //

struct Registry::Impl
{
    /** @brief Sentinel value meaning "no next slot". */
    static constexpr core::u32 kNoNext = ~core::u32{0};

    struct SlotInfo
    {
        core::u32 generation{0};
        core::u32 nextFree{kNoNext};
        Archetype archetype{};
        bool      alive{false};
    };

    std::vector<SlotInfo> slots;
    core::u32             freeHead{kNoNext};
    core::u32             liveCount{0};
    core::u32             retiredCount{0};

    explicit Impl(core::u32 initialCapacity)
    {
        slots.reserve(initialCapacity);
    }

    /**
     * @brief Pops a recycled slot, or appends a fresh one.
     * @return kNoNext when the slot space is exhausted.
     */
    core::u32 allocateSlot()
    {
        if (freeHead != kNoNext)
        {
            const core::u32 slot = freeHead;
            freeHead             = slots[slot].nextFree;
            slots[slot].nextFree = kNoNext;
            return slot;
        }

        // The last slot index is reserved: at the last generation it packs to kNull.
        const auto slot = static_cast<core::u32>(slots.size());
        if (slot >= EntityId::kSlotMask)
        {
            return kNoNext;
        }
        slots.emplace_back();
        return slot;
    }

    void freeSlot(core::u32 slot)
    {
        slots[slot].nextFree = freeHead;
        freeHead             = slot;
    }

    [[nodiscard]] SlotInfo* live(EntityId id)
    {
        if (!id.isValid() || id.slot() >= slots.size())
        {
            return nullptr;
        }
        auto& info = slots[id.slot()];
        return (info.alive && info.generation == id.generation()) ? &info : nullptr;
    }
};

// ========================================================================== //
//  Registry                                                                  //
// ========================================================================== //

Registry::Registry(core::u32 initialCapacity)
    : _impl{std::make_unique<Impl>(initialCapacity)}
{}

Registry::~Registry() = default;

Registry::Registry(Registry&&) noexcept            = default;
Registry& Registry::operator=(Registry&&) noexcept = default;

core::Expected<EntityId> Registry::create(const Archetype& archetype)
{
    const core::u32 slot = _impl->allocateSlot();
    if (slot == Impl::kNoNext)
    {
        return core::makeError(core::ErrorCode::kOutOfMemory, "Entity slot pool exhausted");
    }

    auto& info     = _impl->slots[slot];
    info.alive     = true;
    info.archetype = archetype;
    ++_impl->liveCount;

    return EntityId{info.generation, slot};
}

core::Expected<void> Registry::destroy(EntityId id)
{
    auto* info = _impl->live(id);
    if (info == nullptr)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Entity is not alive");
    }

    info->alive     = false;
    info->archetype = Archetype{};

    --_impl->liveCount;

    // A slot whose generation is exhausted is retired, never wrapped: a
    // wrapped generation would hand out an id equal to a dead one.
    if (info->generation == EntityId::kGenerationMask)
    {
        ++_impl->retiredCount;
        core::Log::debug(core::LogTag::kEcs, "Registry: slot generation exhausted, slot retired");
        return {};
    }

    info->generation += 1;
    _impl->freeSlot(id.slot());

    return {};
}

bool Registry::isAlive(EntityId id) const noexcept
{
    return _impl->live(id) != nullptr;
}

core::u32 Registry::liveCount() const noexcept
{
    return _impl->liveCount;
}

core::u32 Registry::retiredCount() const noexcept
{
    return _impl->retiredCount;
}

Archetype* Registry::archetype(EntityId id) noexcept
{
    auto* info = _impl->live(id);
    return info ? &info->archetype : nullptr;
}

const Archetype* Registry::archetype(EntityId id) const noexcept
{
    auto* info = _impl->live(id);
    return info ? &info->archetype : nullptr;
}

} // namespace vgl::ecs
