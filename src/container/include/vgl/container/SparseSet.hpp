/**
 * @file SparseSet.hpp
 * @brief Generational sparse set with O(1) lookup and swap-and-pop removal.
 *
 * Maps entity handles to dense storage indices.  The sparse array is
 * indexed by the handle's slot; the dense side remembers the full handle,
 * so a stale handle whose slot has been recycled never resolves to the new
 * occupant's value.  The dense array is always compact.
 *
 * @tparam K Handle type (see core::SlotKey).
 * @tparam T Payload type stored in the dense array.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CONTAINER_SPARSE_SET_HPP
    #define VGL_CONTAINER_SPARSE_SET_HPP

    #include <vgl/core/Assert.hpp>
    #include <vgl/core/Concepts.hpp>
    #include <vgl/core/Types.hpp>

    #include <optional>
    #include <span>
    #include <vector>

namespace vgl::container {

/**
 * @brief Generational sparse set.
 * @tparam K Handle type.
 * @tparam T Dense-stored payload type.
 */
template <core::SlotKey K, typename T>
class SparseSet final {
public:
    /**
     * @brief Construct a sparse set, reserving room for @p reserveSlots.
     */
    explicit SparseSet(core::u32 reserveSlots = 0);

    /**
     * @brief Insert an element associated with a handle.
     * @return True on success, false if the slot is already occupied.
     */
    bool insert(K key, T val);

    /**
     * @brief Remove the element associated with a handle (swap-and-pop).
     * @return True if found and removed.
     */
    bool remove(K key);

    /**
     * @brief Move the element out and remove it.
     * @return The removed value, or std::nullopt when @p key is absent.
     */
    [[nodiscard]] std::optional<T> take(K key);

    /**
     * @brief Lookup by handle.
     * @return Pointer to the dense value, or nullptr.  Invalidated by any
     *         subsequent insert or remove.
     */
    [[nodiscard]] T       *find(K key);
    [[nodiscard]] const T *find(K key) const;

    [[nodiscard]] bool contains(K key) const;

    [[nodiscard]] core::u32 size()  const { return static_cast<core::u32>(_dense.size()); }
    [[nodiscard]] bool      empty() const { return _dense.empty(); }

    [[nodiscard]] std::span<const T> dense() const { return _dense; }
    [[nodiscard]] std::span<const K> keys()  const { return _denseKeys; }

    void clear();

private:
    static constexpr core::u32 kInvalid = ~core::u32{0};

    [[nodiscard]] core::u32 denseIndex(K key) const;

    std::vector<core::u32> _sparse;
    std::vector<T>         _dense;
    std::vector<K>         _denseKeys;
};

} // namespace vgl::container

    #include "SparseSet.inl"

#endif // VGL_CONTAINER_SPARSE_SET_HPP
