/**
 * @file TestSparseSet.cpp
 * @brief Unit tests for container::SparseSet.
 */

#include <catch2/catch_test_macros.hpp>

#include <vgl/container/SparseSet.hpp>

#include <string>

using namespace vgl;

namespace {

struct Handle
{
    core::u32 s{0};
    core::u32 gen{0};

    [[nodiscard]] core::u32 slot() const { return s; }
    bool operator==(const Handle&) const = default;
};

} // namespace

TEST_CASE("SparseSet insert, find and contains", "[container][sparseset]")
{
    container::SparseSet<Handle, std::string> set;

    REQUIRE(set.empty());
    REQUIRE(set.insert(Handle{3, 0}, "three"));
    REQUIRE(set.insert(Handle{0, 0}, "zero"));
    REQUIRE_FALSE(set.insert(Handle{3, 0}, "again"));

    REQUIRE(set.size() == 2);
    REQUIRE(set.contains(Handle{3, 0}));
    REQUIRE(*set.find(Handle{0, 0}) == "zero");
    REQUIRE(set.find(Handle{7, 0}) == nullptr);
}

TEST_CASE("SparseSet rejects stale handles of a recycled slot", "[container][sparseset]")
{
    container::SparseSet<Handle, int> set;
    REQUIRE(set.insert(Handle{1, 0}, 10));
    REQUIRE(set.remove(Handle{1, 0}));
    REQUIRE(set.insert(Handle{1, 1}, 11));

    REQUIRE_FALSE(set.contains(Handle{1, 0}));
    REQUIRE(set.find(Handle{1, 0}) == nullptr);
    REQUIRE_FALSE(set.remove(Handle{1, 0}));
    REQUIRE(*set.find(Handle{1, 1}) == 11);
}

TEST_CASE("SparseSet swap-and-pop keeps the dense side compact", "[container][sparseset]")
{
    container::SparseSet<Handle, int> set;
    for (core::u32 i = 0; i < 5; ++i)
        REQUIRE(set.insert(Handle{i, 0}, static_cast<int>(i) * 10));

    REQUIRE(set.remove(Handle{1, 0}));

    REQUIRE(set.size() == 4);
    REQUIRE(set.dense().size() == set.keys().size());
    for (core::u32 i : {0u, 2u, 3u, 4u})
        REQUIRE(*set.find(Handle{i, 0}) == static_cast<int>(i) * 10);
}

TEST_CASE("SparseSet take moves the value out", "[container][sparseset]")
{
    container::SparseSet<Handle, std::string> set;
    REQUIRE(set.insert(Handle{2, 0}, "payload"));

    auto taken = set.take(Handle{2, 0});
    REQUIRE(taken.has_value());
    REQUIRE(*taken == "payload");
    REQUIRE_FALSE(set.contains(Handle{2, 0}));
    REQUIRE_FALSE(set.take(Handle{2, 0}).has_value());
}
