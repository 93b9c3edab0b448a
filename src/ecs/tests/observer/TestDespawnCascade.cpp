/**
 * @file TestDespawnCascade.cpp
 * @brief Tests for the observer despawn cascade driven by ObservedBy removal.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "ObserverTestUtils.hpp"

#include <vgl/ecs/observer/Observers.hpp>

#include <algorithm>
#include <array>
#include <vector>

using namespace vgl;
using namespace vgl::ecs;
using vgl::ecs::test::counter;
using vgl::ecs::test::requireSymmetric;
using vgl::ecs::test::watches;

namespace {

constexpr EventId kPing{1};

EntityId watchAll(World& world, std::span<const EntityId> subjects, int& hits)
{
    ObserverDescriptor descriptor;
    descriptor.withEvent(kPing);
    for (const EntityId s : subjects)
        descriptor.withEntity(s);
    return world.spawnObserver(Observer{counter(hits), descriptor}).value();
}

} // namespace

TEST_CASE("Registration links subject and observer both ways", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const EntityId e = world.spawn().value();
    const EntityId o = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();

    REQUIRE(world.has(e, ComponentId::ObservedBy));
    REQUIRE(world.has(o, ComponentId::Observer));
    REQUIRE(world.observedBy(e)->get().size() == 1);
    REQUIRE(world.observedBy(e)->get()[0] == o);
    REQUIRE(watches(world, o, e));
    REQUIRE(world.observer(o)->despawnedWatched() == 0);
    requireSymmetric(world, {e, o});
}

TEST_CASE("Observer despawns with its only subject", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const EntityId e = world.spawn().value();
    const EntityId o = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();

    REQUIRE(world.despawn(e).has_value());

    REQUIRE_FALSE(world.isAlive(o));
    REQUIRE(world.liveCount() == 0);
    REQUIRE(world.pendingCommands() == 0);
    REQUIRE(world.observers().get(kPing) == nullptr);
}

TEST_CASE("Observer survives until its last subject is gone, in any order", "[observer][cascade]")
{
    std::array<int, 3> order{0, 1, 2};
    do
    {
        World world;
        int hits = 0;
        const std::array<EntityId, 3> subjects{
            world.spawn().value(), world.spawn().value(), world.spawn().value()};
        const EntityId o = watchAll(world, subjects, hits);

        for (std::size_t step = 0; step < order.size(); ++step)
        {
            REQUIRE(world.isAlive(o));
            REQUIRE(world.despawn(subjects[static_cast<std::size_t>(order[step])]).has_value());

            if (step + 1 < order.size())
            {
                REQUIRE(world.isAlive(o));
                REQUIRE(world.observer(o)->despawnedWatched() == step + 1);
                REQUIRE(world.observer(o)->liveWatched() == order.size() - step - 1);
            }
        }
        REQUIRE_FALSE(world.isAlive(o));
    }
    while (std::next_permutation(order.begin(), order.end()));
}

TEST_CASE("Cascade completes across several flushes", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const std::array<EntityId, 2> subjects{world.spawn().value(), world.spawn().value()};
    const EntityId o = watchAll(world, subjects, hits);

    world.commands().despawn(subjects[0]);
    REQUIRE(world.isAlive(o));
    world.flush();
    REQUIRE(world.isAlive(o));
    REQUIRE(world.observer(o)->despawnedWatched() == 1);

    world.commands().despawn(subjects[1]);
    world.flush();
    REQUIRE_FALSE(world.isAlive(o));
}

TEST_CASE("The same removal is never counted twice", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const std::array<EntityId, 2> subjects{world.spawn().value(), world.spawn().value()};
    const EntityId o = watchAll(world, subjects, hits);

    DeferredWorld view = world.deferred();
    const HookContext ctx{subjects[0], ComponentId::ObservedBy};
    ObservedBy::onRemove(view, ctx);
    ObservedBy::onRemove(view, ctx);

    REQUIRE(world.observer(o)->despawnedWatched() == 1);
    REQUIRE(world.observedBy(subjects[0])->empty());
    REQUIRE(world.pendingCommands() == 0);
    REQUIRE(world.isAlive(o));
}

TEST_CASE("The cascade only enqueues the observer despawn", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const EntityId e = world.spawn().value();
    const EntityId o = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();

    DeferredWorld view = world.deferred();
    ObservedBy::onRemove(view, HookContext{e, ComponentId::ObservedBy});

    REQUIRE(world.isAlive(o));
    REQUIRE(world.pendingCommands() == 1);

    world.flush();
    REQUIRE_FALSE(world.isAlive(o));
}

TEST_CASE("An externally despawned observer leaves its subject consistent", "[observer][cascade]")
{
    World world;
    int hitsA = 0;
    int hitsB = 0;
    const EntityId e  = world.spawn().value();
    const EntityId oa = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hitsA)).value();
    const EntityId ob = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hitsB)).value();

    REQUIRE(world.despawn(oa).has_value());
    REQUIRE_FALSE(world.observedBy(e)->contains(oa));
    requireSymmetric(world, {e, ob});

    world.trigger(kPing, e);
    REQUIRE(hitsA == 0);
    REQUIRE(hitsB == 1);

    REQUIRE(world.despawn(e).has_value());
    REQUIRE_FALSE(world.isAlive(ob));
    REQUIRE(world.liveCount() == 0);
}

TEST_CASE("Cascades chain through observers watching observers", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const EntityId e  = world.spawn().value();
    const EntityId o1 = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();
    const EntityId o2 = world.observe(o1, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();
    const EntityId o3 = world.observe(o2, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();

    REQUIRE(world.despawn(e).has_value());

    REQUIRE_FALSE(world.isAlive(o1));
    REQUIRE_FALSE(world.isAlive(o2));
    REQUIRE_FALSE(world.isAlive(o3));
    REQUIRE(world.liveCount() == 0);
}

TEST_CASE("Despawning an observer keeps its subject alive", "[observer][cascade]")
{
    World world;
    int hits = 0;
    const EntityId e = world.spawn().value();
    const EntityId o = world.observe(e, ObserverDescriptor{}.withEvent(kPing), counter(hits)).value();

    REQUIRE(world.despawn(o).has_value());
    REQUIRE(world.isAlive(e));
    REQUIRE(world.observedBy(e)->empty());
    REQUIRE(world.despawn(e).has_value());
    REQUIRE(world.liveCount() == 0);
}

TEST_CASE("Stale index entries never reach a removed entity", "[observer][cascade][index]")
{
    const bool prune = GENERATE(true, false);
    World world{WorldConfig::Builder{}.pruneStaleIndex(prune).build()};
    int hits = 0;

    const std::array<EntityId, 2> subjects{world.spawn().value(), world.spawn().value()};
    const EntityId o = watchAll(world, subjects, hits);

    REQUIRE(world.despawn(subjects[0]).has_value());
    REQUIRE(world.isAlive(o));
    REQUIRE(world.observers().references(subjects[0]) == !prune);

    world.trigger(kPing, subjects[0]);
    REQUIRE(hits == 0);

    // The recycled slot must not inherit the stale registration.
    const EntityId reused = world.spawn().value();
    REQUIRE(reused.slot() == subjects[0].slot());
    world.trigger(kPing, reused);
    REQUIRE(hits == 0);

    world.trigger(kPing, subjects[1]);
    REQUIRE(hits == 1);

    REQUIRE(world.despawn(subjects[1]).has_value());
    REQUIRE_FALSE(world.isAlive(o));
    REQUIRE_FALSE(world.observers().references(subjects[0]));
    REQUIRE_FALSE(world.observers().references(subjects[1]));
}

TEST_CASE("A slot recycled through every generation never revives a stale entry", "[observer][cascade][index]")
{
    World world{WorldConfig::Builder{}.pruneStaleIndex(false).build()};
    int hits = 0;

    const std::array<EntityId, 2> subjects{world.spawn().value(), world.spawn().value()};
    const EntityId o = watchAll(world, subjects, hits);
    const EntityId dead = subjects[0];

    REQUIRE(world.despawn(dead).has_value());
    REQUIRE(world.observers().references(dead));

    // One full generation cycle plus a few spawns past the retirement.
    constexpr core::u32 kCycles = EntityId::kGenerationMask + 8;
    for (core::u32 i = 0; i < kCycles; ++i)
    {
        const EntityId next = world.spawn().value();
        REQUIRE(next != dead);
        world.trigger(kPing, next);
        REQUIRE(world.despawn(next).has_value());
    }

    REQUIRE(hits == 0);
    REQUIRE(world.isAlive(o));
    REQUIRE(world.observer(o)->despawnedWatched() == 1);
}
