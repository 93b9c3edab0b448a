/**
 * @file SparseSet.inl
 * @brief Template implementation of the generational sparse set.
 * @see   SparseSet.hpp
 */

#ifndef VGL_CONTAINER_SPARSE_SET_INL
    #define VGL_CONTAINER_SPARSE_SET_INL

    #include <utility>

namespace vgl::container {

template <core::SlotKey K, typename T>
SparseSet<K, T>::SparseSet(core::u32 reserveSlots)
{
    _sparse.reserve(reserveSlots);
    _dense.reserve(reserveSlots);
    _denseKeys.reserve(reserveSlots);
}

template <core::SlotKey K, typename T>
core::u32 SparseSet<K, T>::denseIndex(K key) const
{
    const core::u32 slot = key.slot();
    if (slot >= _sparse.size())
        return kInvalid;

    const core::u32 idx = _sparse[slot];
    if (idx == kInvalid || !(_denseKeys[idx] == key))
        return kInvalid;
    return idx;
}

template <core::SlotKey K, typename T>
bool SparseSet<K, T>::insert(K key, T val)
{
    const core::u32 slot = key.slot();
    if (slot >= _sparse.size())
        _sparse.resize(static_cast<core::usize>(slot) + 1, kInvalid);
    if (_sparse[slot] != kInvalid)
        return false;

    VGL_ASSERT(_dense.size() < kInvalid, "SparseSet dense index overflow");
    _sparse[slot] = static_cast<core::u32>(_dense.size());
    _dense.push_back(std::move(val));
    _denseKeys.push_back(key);
    return true;
}

template <core::SlotKey K, typename T>
bool SparseSet<K, T>::remove(K key)
{
    const core::u32 denseIdx = denseIndex(key);
    if (denseIdx == kInvalid)
        return false;

    VGL_ASSERT(_dense.size() == _denseKeys.size(), "SparseSet dense arrays out of step");
    const core::u32 lastDenseIdx = static_cast<core::u32>(_dense.size()) - 1;
    if (denseIdx != lastDenseIdx) {
        const K lastKey          = _denseKeys[lastDenseIdx];
        _dense[denseIdx]         = std::move(_dense[lastDenseIdx]);
        _denseKeys[denseIdx]     = lastKey;
        _sparse[lastKey.slot()]  = denseIdx;
    }

    _dense.pop_back();
    _denseKeys.pop_back();
    _sparse[key.slot()] = kInvalid;
    return true;
}

template <core::SlotKey K, typename T>
std::optional<T> SparseSet<K, T>::take(K key)
{
    T *val = find(key);
    if (val == nullptr)
        return std::nullopt;

    std::optional<T> out{std::move(*val)};
    remove(key);
    return out;
}

template <core::SlotKey K, typename T>
T *SparseSet<K, T>::find(K key)
{
    const core::u32 denseIdx = denseIndex(key);
    return denseIdx == kInvalid ? nullptr : &_dense[denseIdx];
}

template <core::SlotKey K, typename T>
const T *SparseSet<K, T>::find(K key) const
{
    const core::u32 denseIdx = denseIndex(key);
    return denseIdx == kInvalid ? nullptr : &_dense[denseIdx];
}

template <core::SlotKey K, typename T>
bool SparseSet<K, T>::contains(K key) const
{
    return denseIndex(key) != kInvalid;
}

template <core::SlotKey K, typename T>
void SparseSet<K, T>::clear()
{
    _sparse.clear();
    _dense.clear();
    _denseKeys.clear();
}

} // namespace vgl::container

#endif // VGL_CONTAINER_SPARSE_SET_INL
