/**
 * @file TestClonePropagation.cpp
 * @brief Tests for carrying observer registrations onto cloned entities.
 */

#include <catch2/catch_test_macros.hpp>

#include "ObserverTestUtils.hpp"

#include <vgl/ecs/EntityCloner.hpp>
#include <vgl/ecs/observer/Observers.hpp>

#include <span>
#include <vector>

using namespace vgl;
using namespace vgl::ecs;
using vgl::ecs::test::counter;
using vgl::ecs::test::requireSymmetric;
using vgl::ecs::test::watches;

namespace {

constexpr EventId kHit{1};
constexpr EventId kHeal{2};
constexpr ComponentId kHealth = userComponent(0);

std::vector<EntityId> toVector(std::span<const EntityId> ids)
{
    return {ids.begin(), ids.end()};
}

} // namespace

TEST_CASE("Cloning with addObservers replicates every registration", "[observer][clone]")
{
    World world;
    int hits = 0;
    const EntityId source = world.spawn(Archetype{kHealth}).value();
    const EntityId whole  = world.observe(source,
        ObserverDescriptor{}.withEvent(kHit).withEvent(kHeal), counter(hits)).value();
    const EntityId scoped = world.observe(source,
        ObserverDescriptor{}.withEvent(kHit).withComponent(kHealth), counter(hits)).value();
    const EntityId target = world.spawn().value();

    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());
    REQUIRE(world.pendingCommands() == 0);

    SECTION("back-reference is an equal, independent list")
    {
        REQUIRE(world.observedBy(target) != nullptr);
        REQUIRE(world.observedBy(target) != world.observedBy(source));
        REQUIRE(toVector(world.observedBy(target)->get()) == toVector(world.observedBy(source)->get()));
        REQUIRE(world.has(target, ComponentId::ObservedBy));
        REQUIRE(world.has(target, kHealth));
    }

    SECTION("observers now also watch the clone")
    {
        REQUIRE(watches(world, whole, target));
        REQUIRE(watches(world, scoped, target));
        REQUIRE(watches(world, whole, source));
        REQUIRE(world.observer(whole)->descriptor().entities.size() == 2);
        REQUIRE(world.observer(whole)->despawnedWatched() == 0);
        requireSymmetric(world, {source, target, whole, scoped});
    }

    SECTION("index buckets map the clone to the source's observers")
    {
        for (const EventId event : {kHit, kHeal})
        {
            const CachedObservers* cached = world.observers().get(event);
            REQUIRE(cached != nullptr);
            REQUIRE(cached->entityObservers.at(target) == cached->entityObservers.at(source));
        }

        const auto& health = world.observers().get(kHit)->componentObservers.at(kHealth);
        REQUIRE(health.entityComponentObservers.at(target) == health.entityComponentObservers.at(source));
        REQUIRE(health.entityComponentObservers.at(target).contains(scoped));
        REQUIRE_FALSE(world.observers().get(kHeal)->componentObservers.contains(kHealth));
    }
}

TEST_CASE("Cloning without addObservers leaves the clone unobserved", "[observer][clone]")
{
    World world;
    int hits = 0;
    const EntityId source = world.spawn().value();
    const EntityId o      = world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(hits)).value();
    const EntityId target = world.spawn().value();

    SECTION("default builder")
    {
        REQUIRE(EntityCloner::build(world).cloneEntity(source, target).has_value());
    }

    SECTION("enabled then disabled again")
    {
        REQUIRE(EntityCloner::build(world).addObservers(true).addObservers(false)
                    .cloneEntity(source, target).has_value());
    }

    REQUIRE(world.observedBy(target) == nullptr);
    REQUIRE_FALSE(world.has(target, ComponentId::ObservedBy));
    REQUIRE_FALSE(watches(world, o, target));
    REQUIRE_FALSE(world.observers().references(target));

    world.trigger(kHit, target);
    REQUIRE(hits == 0);
}

TEST_CASE("Source and clone keep their observers alive independently", "[observer][clone]")
{
    World world;
    int hits = 0;
    const EntityId source = world.spawn().value();
    const EntityId o      = world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(hits)).value();
    const EntityId target = world.spawn().value();
    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());

    SECTION("source removed first")
    {
        REQUIRE(world.despawn(source).has_value());
        REQUIRE(world.isAlive(o));
        REQUIRE(world.observer(o)->despawnedWatched() == 1);

        world.trigger(kHit, target);
        REQUIRE(hits == 1);

        REQUIRE(world.despawn(target).has_value());
        REQUIRE_FALSE(world.isAlive(o));
    }

    SECTION("clone removed first")
    {
        REQUIRE(world.despawn(target).has_value());
        REQUIRE(world.isAlive(o));

        world.trigger(kHit, source);
        REQUIRE(hits == 1);

        REQUIRE(world.despawn(source).has_value());
        REQUIRE_FALSE(world.isAlive(o));
    }
}

TEST_CASE("Registrations made after cloning stay on their own entity", "[observer][clone]")
{
    World world;
    int first = 0;
    int later = 0;
    const EntityId source = world.spawn().value();
    REQUIRE(world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(first)).has_value());
    const EntityId target = world.spawn().value();
    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());

    const EntityId lateObserver =
        world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(later)).value();

    REQUIRE(world.observedBy(source)->size() == 2);
    REQUIRE(world.observedBy(target)->size() == 1);
    REQUIRE_FALSE(world.observers().get(kHit)->entityObservers.at(target).contains(lateObserver));

    world.trigger(kHit, target);
    REQUIRE(first == 1);
    REQUIRE(later == 0);
}

TEST_CASE("Cloning onto an observed target merges the registrations", "[observer][clone]")
{
    World world;
    int fromSource = 0;
    int fromTarget = 0;
    const EntityId source = world.spawn().value();
    const EntityId target = world.spawn().value();
    const EntityId os = world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(fromSource)).value();
    const EntityId ot = world.observe(target, ObserverDescriptor{}.withEvent(kHit), counter(fromTarget)).value();

    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());

    REQUIRE(toVector(world.observedBy(target)->get()) == std::vector<EntityId>{ot, os});
    const auto& bucket = world.observers().get(kHit)->entityObservers.at(target);
    REQUIRE(bucket.contains(os));
    REQUIRE(bucket.contains(ot));
    requireSymmetric(world, {source, target, os, ot});

    SECTION("cloning twice adds nothing")
    {
        REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());
        REQUIRE(world.observedBy(target)->size() == 2);
        REQUIRE(world.observer(os)->descriptor().entities.size() == 2);
    }

    world.trigger(kHit, target);
    REQUIRE(fromSource == 1);
    REQUIRE(fromTarget == 1);
}

TEST_CASE("Clone propagation is skipped whole when the target vanished", "[observer][clone]")
{
    World world;
    int hits = 0;
    const EntityId source = world.spawn().value();
    const EntityId o      = world.observe(source, ObserverDescriptor{}.withEvent(kHit), counter(hits)).value();
    const EntityId target = world.spawn().value();

    world.commands().despawn(target);
    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());

    REQUIRE_FALSE(world.isAlive(target));
    REQUIRE(world.observer(o)->descriptor().entities.size() == 1);
    REQUIRE_FALSE(world.observers().references(target));
    REQUIRE(world.observedBy(source)->size() == 1);
}

TEST_CASE("Cloning an unobserved entity never runs propagation", "[observer][clone]")
{
    World world;
    const EntityId source = world.spawn().value();
    const EntityId target = world.spawn().value();

    REQUIRE(EntityCloner::build(world).addObservers(true).cloneEntity(source, target).has_value());

    REQUIRE(world.observedBy(target) == nullptr);
    REQUIRE(world.pendingCommands() == 0);
}
