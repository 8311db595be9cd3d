#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sedit/ecs/registry.hpp"

using namespace sedit::ecs;

namespace {

struct Health {
    int value = 100;
};

struct Speed {
    float value = 1.0f;
};

} // namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST(RegistryTest, IdsStartAtOneAndIncrease) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    auto b = reg.CreateEntity("B");

    EXPECT_EQ(a.id(), 1u);
    EXPECT_EQ(b.id(), 2u);
    EXPECT_EQ(reg.Count(), 2u);
    EXPECT_TRUE(reg.IsAlive(a));
}

TEST(RegistryTest, BlankNameGetsDefault) {
    Registry reg;
    auto e = reg.CreateEntity();
    EXPECT_EQ(reg.GetName(e), "Entity_1");
    EXPECT_TRUE(reg.IsActive(e));
    EXPECT_TRUE(reg.GetTags(e).empty());
}

TEST(RegistryTest, NewEntityIsTopLevel) {
    Registry reg;
    auto e = reg.CreateEntity("A");
    EXPECT_EQ(reg.GetParent(e), kNullEntity);
    ASSERT_EQ(reg.GetChildren(kNullEntity).size(), 1u);
    EXPECT_EQ(reg.GetChildren(kNullEntity)[0], e);
}

TEST(RegistryTest, DestroyRemovesComponentsAndRecord) {
    Registry reg;
    auto e = reg.CreateEntity("A");
    reg.AddComponent<Health>(e);

    reg.DestroyEntity(e);

    EXPECT_FALSE(reg.IsAlive(e));
    EXPECT_FALSE(reg.HasComponent<Health>(e));
    EXPECT_TRUE(reg.GetChildren(kNullEntity).empty());
    EXPECT_EQ(reg.Count(), 0u);
}

TEST(RegistryTest, DestroyIsRecursive) {
    Registry reg;
    auto p = reg.CreateEntity("P");
    auto c = reg.CreateEntity("C");
    auto g = reg.CreateEntity("G");
    ASSERT_TRUE(reg.SetParent(c, p));
    ASSERT_TRUE(reg.SetParent(g, c));
    reg.AddComponent<Health>(g);

    reg.DestroyEntity(p);

    EXPECT_FALSE(reg.IsAlive(c));
    EXPECT_FALSE(reg.IsAlive(g));
    EXPECT_TRUE(reg.EntitiesWith<Health>().empty());
}

TEST(RegistryTest, DestroyUnknownIsNoOp) {
    Registry reg;
    static_cast<void>(reg.CreateEntity("A"));
    reg.DestroyEntity(Entity(42));
    reg.DestroyEntity(kNullEntity);
    EXPECT_EQ(reg.Count(), 1u);
}

TEST(RegistryTest, IdsAreNeverReused) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    reg.DestroyEntity(a);
    auto b = reg.CreateEntity("B");
    EXPECT_NE(a, b);
    EXPECT_FALSE(reg.IsAlive(a));
}

TEST(RegistryTest, CreateUnderRequestedIdRevivesDestroyedId) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    auto b = reg.CreateEntity("B");
    reg.DestroyEntity(a);

    auto revived = reg.CreateEntity(a, "A again");
    EXPECT_EQ(revived, a);
    EXPECT_TRUE(reg.IsAlive(a));
    EXPECT_EQ(reg.GetName(a), "A again");
    EXPECT_EQ(reg.GetChildren(kNullEntity), (std::vector<Entity>{b, a}));

    // Normal allocation is unaffected.
    EXPECT_EQ(reg.CreateEntity("C").id(), 3u);
}

TEST(RegistryTest, CreateUnderRequestedIdRefusesLiveAndNull) {
    Registry reg;
    auto a = reg.CreateEntity("A");

    EXPECT_EQ(reg.CreateEntity(a, "Clash"), kNullEntity);
    EXPECT_EQ(reg.GetName(a), "A");
    EXPECT_EQ(reg.CreateEntity(kNullEntity, "Root"), kNullEntity);
    EXPECT_EQ(reg.Count(), 1u);
}

TEST(RegistryTest, CreateUnderRequestedIdAdvancesAllocation) {
    Registry reg;
    auto far = reg.CreateEntity(Entity(10), "Far");
    EXPECT_EQ(far, Entity(10));
    EXPECT_EQ(reg.CreateEntity("Next").id(), 11u);
}

TEST(RegistryTest, ClearKeepsCounting) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    reg.AddComponent<Health>(a);
    reg.Clear();

    EXPECT_EQ(reg.Count(), 0u);
    EXPECT_FALSE(reg.HasComponent<Health>(a));
    EXPECT_TRUE(reg.GetChildren(kNullEntity).empty());

    auto b = reg.CreateEntity("B");
    EXPECT_EQ(b.id(), 2u);
}

TEST(RegistryTest, AllEntitiesInCreationOrder) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    auto b = reg.CreateEntity("B");
    auto c = reg.CreateEntity("C");
    reg.SetParent(a, c);

    EXPECT_EQ(reg.AllEntities(), (std::vector<Entity>{a, b, c}));
}

// ===========================================================================
// Components
// ===========================================================================

TEST(RegistryTest, AddComponentToUnknownEntityFails) {
    Registry reg;
    EXPECT_EQ(reg.AddComponent<Health>(Entity(9)), nullptr);
    EXPECT_EQ(reg.GetComponent<Health>(Entity(9)), nullptr);
    EXPECT_FALSE(reg.HasComponent<Health>(Entity(9)));
}

TEST(RegistryTest, AddGetRemoveComponent) {
    Registry reg;
    auto e = reg.CreateEntity("A");

    auto* hp = reg.AddComponent<Health>(e, {40});
    ASSERT_NE(hp, nullptr);
    EXPECT_EQ(reg.GetComponent<Health>(e)->value, 40);

    reg.RemoveComponent<Health>(e);
    EXPECT_FALSE(reg.HasComponent<Health>(e));
    reg.RemoveComponent<Speed>(e);
}

TEST(RegistryTest, EntitiesWithAll) {
    Registry reg;
    auto a = reg.CreateEntity("A");
    auto b = reg.CreateEntity("B");
    auto c = reg.CreateEntity("C");
    reg.AddComponent<Health>(a);
    reg.AddComponent<Health>(b);
    reg.AddComponent<Health>(c);
    reg.AddComponent<Speed>(b);

    auto both = reg.EntitiesWithAll<Health, Speed>();
    ASSERT_EQ(both.size(), 1u);
    EXPECT_EQ(both[0], b);

    Registry empty;
    EXPECT_TRUE((empty.EntitiesWithAll<Health, Speed>().empty()));
}

TEST(RegistryTest, CopyComponentsCopiesEveryType) {
    Registry reg;
    auto src = reg.CreateEntity("Src");
    auto dst = reg.CreateEntity("Dst");
    reg.AddComponent<Health>(src, {5});
    reg.AddComponent<Speed>(src, {2.5f});

    EXPECT_EQ(reg.CopyComponents(src, dst), 2u);
    EXPECT_EQ(reg.GetComponent<Health>(dst)->value, 5);
    EXPECT_FLOAT_EQ(reg.GetComponent<Speed>(dst)->value, 2.5f);

    EXPECT_EQ(reg.CopyComponents(src, Entity(99)), 0u);
}

// ===========================================================================
// Metadata
// ===========================================================================

TEST(RegistryTest, NameAndActive) {
    Registry reg;
    auto e = reg.CreateEntity("Old");

    EXPECT_TRUE(reg.SetName(e, "New"));
    EXPECT_EQ(reg.GetName(e), "New");
    EXPECT_TRUE(reg.SetActive(e, false));
    EXPECT_FALSE(reg.IsActive(e));

    EXPECT_FALSE(reg.SetName(Entity(8), "X"));
    EXPECT_EQ(reg.GetName(Entity(8)), "");
    EXPECT_FALSE(reg.IsActive(Entity(8)));
}

TEST(RegistryTest, TagsAreASortedSet) {
    Registry reg;
    auto e = reg.CreateEntity("A");

    EXPECT_TRUE(reg.AddTag(e, "static"));
    EXPECT_TRUE(reg.AddTag(e, "enemy"));
    EXPECT_FALSE(reg.AddTag(e, "enemy"));
    EXPECT_FALSE(reg.AddTag(e, ""));

    EXPECT_EQ(reg.GetTags(e), (std::vector<std::string>{"enemy", "static"}));
    EXPECT_TRUE(reg.HasTag(e, "enemy"));

    EXPECT_TRUE(reg.RemoveTag(e, "enemy"));
    EXPECT_FALSE(reg.RemoveTag(e, "enemy"));
    EXPECT_FALSE(reg.HasTag(e, "enemy"));
}

TEST(RegistryTest, FindByNameAndTag) {
    Registry reg;
    auto a = reg.CreateEntity("Lamp");
    auto b = reg.CreateEntity("Lamp");
    reg.AddTag(b, "light");

    EXPECT_EQ(reg.FindByName("Lamp"), a);
    EXPECT_EQ(reg.FindByName("Missing"), kNullEntity);
    EXPECT_EQ(reg.EntitiesWithTag("light"), (std::vector<Entity>{b}));
}
