#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "sedit/ecs/component_storage.hpp"
#include "sedit/ecs/entity.hpp"

using namespace sedit::ecs;

// ── Test component types ────────────────────────────────────────────────────

struct Position {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

struct Label {
    std::string value;
};

// ===========================================================================
// Entity
// ===========================================================================

TEST(EntityTest, DefaultIsNull) {
    Entity e;
    EXPECT_FALSE(e.isValid());
    EXPECT_EQ(e, kNullEntity);
    EXPECT_EQ(Entity::null(), kNullEntity);
}

TEST(EntityTest, OrderingFollowsId) {
    EXPECT_LT(Entity(1), Entity(2));
    EXPECT_EQ(Entity(7).id(), 7u);
    EXPECT_TRUE(Entity(7).isValid());
}

// ===========================================================================
// Storage type ids
// ===========================================================================

TEST(ComponentStorageTypeIdTest, DistinctTypesGetDistinctIds) {
    EXPECT_NE(ComponentStorage<Position>::TypeId(), ComponentStorage<Label>::TypeId());
    EXPECT_EQ(ComponentStorage<Position>::TypeId(), ComponentStorage<Position>::TypeId());
}

// ===========================================================================
// Add / Get / Has
// ===========================================================================

TEST(ComponentStorageTest, AddAndGet) {
    ComponentStorage<Position> storage;
    Entity e(3);

    auto& pos = storage.Add(e, {1.0f, 2.0f, 3.0f});
    EXPECT_FLOAT_EQ(pos.y, 2.0f);

    ASSERT_NE(storage.Get(e), nullptr);
    EXPECT_FLOAT_EQ(storage.Get(e)->z, 3.0f);
    EXPECT_TRUE(storage.Has(e));
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, AddOverwritesInPlace) {
    ComponentStorage<Label> storage;
    Entity e(1);

    storage.Add(e, {"first"});
    storage.Add(e, {"second"});

    EXPECT_EQ(storage.Size(), 1u);
    EXPECT_EQ(storage.Get(e)->value, "second");
}

TEST(ComponentStorageTest, MissingEntityReturnsNull) {
    ComponentStorage<Position> storage;
    storage.Add(Entity(1));

    EXPECT_EQ(storage.Get(Entity(2)), nullptr);
    EXPECT_EQ(storage.Get(Entity(5000)), nullptr);
    EXPECT_FALSE(storage.Has(Entity(5000)));
    EXPECT_EQ(storage.EntityAt(10), kNullEntity);
}

// ===========================================================================
// Remove
// ===========================================================================

TEST(ComponentStorageTest, RemoveSwapsLastIntoHole) {
    ComponentStorage<Label> storage;
    storage.Add(Entity(1), {"a"});
    storage.Add(Entity(2), {"b"});
    storage.Add(Entity(3), {"c"});

    storage.Remove(Entity(1));

    EXPECT_EQ(storage.Size(), 2u);
    EXPECT_FALSE(storage.Has(Entity(1)));
    EXPECT_EQ(storage.EntityAt(0), Entity(3));
    EXPECT_EQ(storage.Get(Entity(3))->value, "c");
    EXPECT_EQ(storage.Get(Entity(2))->value, "b");
}

TEST(ComponentStorageTest, RemoveLastAndAbsent) {
    ComponentStorage<Label> storage;
    storage.Add(Entity(1), {"a"});
    storage.Add(Entity(2), {"b"});

    storage.Remove(Entity(2));
    storage.Remove(Entity(2));
    storage.Remove(Entity(99));

    EXPECT_EQ(storage.Size(), 1u);
    EXPECT_EQ(storage.Get(Entity(1))->value, "a");
}

TEST(ComponentStorageTest, ReAddAfterRemove) {
    ComponentStorage<Position> storage;
    storage.Add(Entity(4), {1.0f, 0.0f, 0.0f});
    storage.Remove(Entity(4));
    storage.Add(Entity(4), {9.0f, 0.0f, 0.0f});

    EXPECT_EQ(storage.Size(), 1u);
    EXPECT_FLOAT_EQ(storage.Get(Entity(4))->x, 9.0f);
}

TEST(ComponentStorageTest, ClearDropsEverything) {
    ComponentStorage<Position> storage;
    storage.Add(Entity(1));
    storage.Add(Entity(2));

    storage.Clear();

    EXPECT_TRUE(storage.Empty());
    EXPECT_FALSE(storage.Has(Entity(1)));
    EXPECT_FALSE(storage.Has(Entity(2)));
}

// ===========================================================================
// Iteration and type-erased access
// ===========================================================================

TEST(ComponentStorageTest, EntitiesSnapshotSurvivesMutation) {
    ComponentStorage<Position> storage;
    for (uint32_t i = 1; i <= 4; ++i) {
        storage.Add(Entity(i));
    }

    auto owners = storage.Entities();
    for (Entity e : owners) {
        storage.Remove(e);
    }

    EXPECT_EQ(owners.size(), 4u);
    EXPECT_TRUE(storage.Empty());
}

TEST(ComponentStorageTest, RangeForVisitsDenseData) {
    ComponentStorage<Position> storage;
    storage.Add(Entity(1), {1.0f, 0.0f, 0.0f});
    storage.Add(Entity(2), {2.0f, 0.0f, 0.0f});

    float sum = 0.0f;
    for (auto& pos : storage) {
        sum += pos.x;
    }
    EXPECT_FLOAT_EQ(sum, 3.0f);
}

TEST(ComponentStorageTest, CopyComponentThroughInterface) {
    ComponentStorage<Label> storage;
    IComponentStorage& erased = storage;
    storage.Add(Entity(1), {"source"});

    EXPECT_TRUE(erased.CopyComponent(Entity(1), Entity(2)));
    EXPECT_FALSE(erased.CopyComponent(Entity(3), Entity(4)));

    EXPECT_EQ(storage.Get(Entity(2))->value, "source");
    EXPECT_FALSE(storage.Has(Entity(4)));

    // The copy is independent of the original.
    storage.Get(Entity(2))->value = "changed";
    EXPECT_EQ(storage.Get(Entity(1))->value, "source");
}

TEST(ComponentStorageTest, CopyComponentSurvivesReallocation) {
    ComponentStorage<Label> storage;
    storage.Add(Entity(1), {std::string(64, 'x')});

    // Copy onto many new owners so dense storage has to grow.
    for (uint32_t i = 2; i < 40; ++i) {
        ASSERT_TRUE(storage.CopyComponent(Entity(1), Entity(i)));
    }
    EXPECT_EQ(storage.Get(Entity(39))->value, std::string(64, 'x'));
}
